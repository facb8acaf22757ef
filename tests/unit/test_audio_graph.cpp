#include <gtest/gtest.h>
#include "AudioContext.hpp"
#include "AudioGraph.hpp"
#include "Errors.hpp"
#include "GainProcessor.hpp"
#include "TestHelper.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>

using namespace morpho;

namespace {

/**
 * @brief Emits a constant on both channels.
 */
class ConstantProcessor : public Processor {
public:
    explicit ConstantProcessor(float value) : value_(value) {}
    void reset() override { ++resets; }
    const char* kind() const override { return "constant"; }
    int resets = 0;

protected:
    void do_pull(AudioBuffer& output) override {
        std::fill(output.left.begin(), output.left.end(), value_);
        std::fill(output.right.begin(), output.right.end(), -value_);
    }

private:
    float value_;
};

} // namespace

TEST(AudioGraphTest, SumsInputsIntoCollector) {
    AudioGraph graph(64);
    auto* a = graph.add_node<ConstantProcessor>(0.25f);
    auto* b = graph.add_node<ConstantProcessor>(0.5f);
    auto* sum = graph.add_node<GainProcessor>(44100, 1.0f);
    graph.connect(a, sum);
    graph.connect(b, sum);
    graph.set_output(sum);
    graph.prepare();

    StereoBlock out(100);
    AudioBuffer view = out.view();
    graph.process(view);

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_FLOAT_EQ(out.left[i], 0.75f);
        EXPECT_FLOAT_EQ(out.right[i], -0.75f);
    }
}

TEST(AudioGraphTest, FanOutFeedsEveryConsumer) {
    AudioGraph graph(32);
    auto* src = graph.add_node<ConstantProcessor>(1.0f);
    auto* half = graph.add_node<GainProcessor>(44100, 0.5f);
    auto* quarter = graph.add_node<GainProcessor>(44100, 0.25f);
    auto* sum = graph.add_node<GainProcessor>(44100, 1.0f);
    graph.connect(src, half);
    graph.connect(src, quarter);
    graph.connect(half, sum);
    graph.connect(quarter, sum);
    graph.set_output(sum);
    graph.prepare();

    StereoBlock out(32);
    AudioBuffer view = out.view();
    graph.process(view);
    EXPECT_FLOAT_EQ(out.left[0], 0.75f);
}

TEST(AudioGraphTest, CycleIsRejected) {
    AudioGraph graph(32);
    auto* a = graph.add_node<GainProcessor>(44100, 1.0f);
    auto* b = graph.add_node<GainProcessor>(44100, 1.0f);
    graph.connect(a, b);
    graph.connect(b, a);
    graph.set_output(b);
    EXPECT_THROW(graph.prepare(), std::logic_error);
    EXPECT_FALSE(graph.is_prepared());
}

TEST(AudioGraphTest, WiringFaultsThrow) {
    AudioGraph graph(32);
    AudioGraph other(32);
    auto* a = graph.add_node<GainProcessor>(44100, 1.0f);
    auto* foreign = other.add_node<GainProcessor>(44100, 1.0f);

    EXPECT_THROW(graph.connect(a, foreign), std::invalid_argument);
    EXPECT_THROW(graph.connect(a, a), std::logic_error);
    EXPECT_THROW(graph.prepare(), std::logic_error); // no output yet

    auto* b = graph.add_node<GainProcessor>(44100, 1.0f);
    graph.connect(a, b);
    EXPECT_THROW(graph.connect(a, b), std::logic_error);
}

TEST(AudioGraphTest, UnpreparedGraphIsSilent) {
    AudioGraph graph(32);
    auto* a = graph.add_node<ConstantProcessor>(1.0f);
    graph.set_output(a);

    StereoBlock out(16);
    std::fill(out.left.begin(), out.left.end(), 3.0f);
    AudioBuffer view = out.view();
    graph.process(view);
    EXPECT_EQ(test::peak(out.left), 0.0f);
}

TEST(AudioGraphTest, OnlyOutputAncestorsRun) {
    AudioGraph graph(32);
    auto* used = graph.add_node<ConstantProcessor>(1.0f);
    auto* orphan = graph.add_node<ConstantProcessor>(5.0f);
    auto* out_node = graph.add_node<GainProcessor>(44100, 1.0f);
    graph.connect(used, out_node);
    graph.set_output(out_node);
    graph.prepare();

    StereoBlock out(8);
    AudioBuffer view = out.view();
    graph.process(view);
    EXPECT_FLOAT_EQ(out.left[0], 1.0f);

    graph.reset();
    EXPECT_EQ(used->resets, 1);
    EXPECT_EQ(orphan->resets, 1);
}

TEST(AudioGraphTest, DescribeIsStableForIdenticalWiring) {
    auto build = [](AudioGraph& g) {
        auto* a = g.add_node<ConstantProcessor>(1.0f);
        auto* b = g.add_node<GainProcessor>(44100, 0.5f);
        g.connect(a, b);
        g.set_output(b);
    };
    AudioGraph g1(64), g2(128);
    build(g1);
    build(g2);
    EXPECT_EQ(g1.describe(), g2.describe());
    EXPECT_EQ(g1.describe(), "0:constant<-[] 1:gain<-[0] out=1");
}

TEST(OfflineContextTest, RejectsInvalidAllocations) {
    const ContextOptions options;
    auto expect_alloc_error = [&](size_t channels, size_t length, int sr) {
        try {
            OfflineAudioContext ctx(channels, length, sr, options);
            FAIL() << "expected RenderError";
        } catch (const RenderError& e) {
            EXPECT_EQ(e.reason(), RenderError::Reason::ContextAllocation);
        }
    };
    expect_alloc_error(2, 0, 44100);
    expect_alloc_error(2, 100, 1000);
    expect_alloc_error(2, 100, 1000000);
    expect_alloc_error(6, 100, 44100);
}

TEST(OfflineContextTest, RendersExactLengthInterleaved) {
    ContextOptions options;
    options.block_size = 64;
    OfflineAudioContext ctx(2, 1000, 48000, options);

    auto pcm = std::make_shared<PcmBuffer>(test::stereo_buffer(std::vector<float>(1000, 0.25f),
                                                               std::vector<float>(1000, -0.5f), 48000));
    auto* src = ctx.create_buffer_source(pcm);
    ctx.connect(src, ctx.destination());

    const auto rendered = ctx.start_rendering();
    EXPECT_EQ(rendered.sample_rate, 48000);
    EXPECT_EQ(rendered.frames, 1000u);
    ASSERT_EQ(rendered.interleaved.size(), 2000u);
    EXPECT_EQ(rendered.interleaved[0], 0.25f);
    EXPECT_EQ(rendered.interleaved[1], -0.5f);
    EXPECT_EQ(rendered.interleaved[1998], 0.25f);
    EXPECT_EQ(rendered.interleaved[1999], -0.5f);

    EXPECT_THROW(ctx.start_rendering(), std::logic_error);
}

TEST(OfflineContextTest, CancelledRenderThrows) {
    OfflineAudioContext ctx(2, 44100, 44100, ContextOptions{});
    auto pcm = std::make_shared<PcmBuffer>(test::mono_buffer(test::sine(440.0, 44100, 44100)));
    ctx.connect(ctx.create_buffer_source(pcm), ctx.destination());

    std::atomic<bool> cancel{true};
    try {
        ctx.start_rendering(&cancel);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_EQ(e.reason(), RenderError::Reason::Cancelled);
    }
}
