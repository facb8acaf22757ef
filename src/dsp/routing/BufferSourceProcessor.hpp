/**
 * @file BufferSourceProcessor.hpp
 * @brief Plays a decoded PcmBuffer into the graph as a stereo signal.
 */

#ifndef MORPHO_BUFFER_SOURCE_PROCESSOR_HPP
#define MORPHO_BUFFER_SOURCE_PROCESSOR_HPP

#include "Processor.hpp"
#include "PcmBuffer.hpp"
#include <algorithm>
#include <atomic>
#include <memory>

namespace morpho {

/**
 * @brief Graph source reading a shared PcmBuffer from a start frame.
 *
 * Mono material is duplicated to both channels (L = R); with two or more
 * channels, channels 0 and 1 feed left and right. Past the end of the
 * buffer the node emits silence and reports ended().
 */
class BufferSourceProcessor : public Processor {
public:
    BufferSourceProcessor(std::shared_ptr<const PcmBuffer> buffer, size_t start_frame = 0)
        : buffer_(std::move(buffer))
        , start_frame_(start_frame)
        , position_(start_frame)
    {}

    size_t position() const { return position_.load(std::memory_order_acquire); }

    bool ended() const {
        return !buffer_ || position() >= buffer_->frames();
    }

    size_t length() const { return buffer_ ? buffer_->frames() : 0; }

    void reset() override {
        position_.store(start_frame_, std::memory_order_release);
    }

    const char* kind() const override { return "source"; }

protected:
    void do_pull(AudioBuffer& output) override {
        const size_t frames = output.frames();
        size_t pos = position_.load(std::memory_order_relaxed);
        const size_t total = length();

        if (!buffer_ || buffer_->channels.empty() || pos >= total) {
            output.clear();
            return;
        }

        const size_t available = std::min(frames, total - pos);
        const auto& left_src = buffer_->channels[0];
        const auto& right_src = buffer_->num_channels() > 1 ? buffer_->channels[1] : buffer_->channels[0];

        std::copy_n(left_src.begin() + static_cast<std::ptrdiff_t>(pos), available, output.left.begin());
        std::copy_n(right_src.begin() + static_cast<std::ptrdiff_t>(pos), available, output.right.begin());

        if (available < frames) {
            std::fill(output.left.begin() + static_cast<std::ptrdiff_t>(available), output.left.end(), 0.0f);
            std::fill(output.right.begin() + static_cast<std::ptrdiff_t>(available), output.right.end(), 0.0f);
        }

        pos += available;
        position_.store(pos, std::memory_order_release);
    }

private:
    std::shared_ptr<const PcmBuffer> buffer_;
    size_t start_frame_;
    std::atomic<size_t> position_;
};

} // namespace morpho

#endif // MORPHO_BUFFER_SOURCE_PROCESSOR_HPP
