/**
 * @file AudioGraph.hpp
 * @brief Owns a set of processors wired as a directed acyclic graph.
 */

#ifndef MORPHO_AUDIO_GRAPH_HPP
#define MORPHO_AUDIO_GRAPH_HPP

#include "Processor.hpp"
#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace morpho {

/**
 * @brief Directed acyclic processing graph.
 *
 * Nodes are owned by the graph and addressed by the pointer add_node()
 * returns. Each node owns one stereo block; before a node runs, the blocks of
 * all its inputs are summed into its own block (a node without inputs gets a
 * cleared block). Only ancestors of the output node are executed.
 *
 * Wiring (add_node, connect, set_output, prepare) happens on the control
 * thread. process() is allocation-free and runs on the audio or render thread.
 */
class AudioGraph {
public:
    explicit AudioGraph(size_t block_size = 512)
        : block_size_(std::max<size_t>(block_size, 1))
    {}

    AudioGraph(const AudioGraph&) = delete;
    AudioGraph& operator=(const AudioGraph&) = delete;

    /**
     * @brief Construct a node in place and take ownership of it.
     */
    template<typename T, typename... Args>
    T* add_node(Args&&... args) {
        auto node = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = node.get();
        nodes_.push_back(Node{std::move(node), {}, StereoBlock{}});
        prepared_ = false;
        return raw;
    }

    /**
     * @brief Route the output of @p from into @p to.
     *
     * @throws std::invalid_argument if either node is not owned by this graph.
     * @throws std::logic_error on a self-connection or a duplicate edge.
     */
    void connect(const Processor* from, const Processor* to) {
        const size_t src = index_of(from);
        const size_t dst = index_of(to);
        if (src == dst) {
            throw std::logic_error("AudioGraph: node connected to itself");
        }
        auto& inputs = nodes_[dst].inputs;
        if (std::find(inputs.begin(), inputs.end(), src) != inputs.end()) {
            throw std::logic_error("AudioGraph: duplicate connection");
        }
        inputs.push_back(src);
        prepared_ = false;
    }

    /**
     * @brief Select the node whose block is the graph output.
     */
    void set_output(const Processor* node) {
        output_ = index_of(node);
        has_output_ = true;
        prepared_ = false;
    }

    /**
     * @brief Compute the execution order and allocate node blocks.
     *
     * @throws std::logic_error if no output is set or the output depends on a cycle.
     */
    void prepare() {
        if (!has_output_) {
            throw std::logic_error("AudioGraph: no output node");
        }

        order_.clear();
        std::vector<Mark> marks(nodes_.size(), Mark::None);
        visit(output_, marks);

        for (size_t idx : order_) {
            if (nodes_[idx].block.frames() != block_size_) {
                nodes_[idx].block = StereoBlock(block_size_);
            }
        }
        prepared_ = true;
    }

    bool is_prepared() const { return prepared_; }

    /**
     * @brief Render output.frames() frames, in chunks of the block size.
     *
     * An unprepared graph produces silence.
     */
    void process(AudioBuffer& output) {
        if (!prepared_) {
            output.clear();
            return;
        }

        size_t offset = 0;
        const size_t total = output.frames();
        while (offset < total) {
            const size_t n = std::min(block_size_, total - offset);
            run_block(n);
            AudioBuffer dst = output.subview(offset, n);
            dst.copy_from(nodes_[output_].block.view(n));
            offset += n;
        }
    }

    void reset() {
        for (auto& node : nodes_) {
            node.processor->reset();
        }
    }

    size_t node_count() const { return nodes_.size(); }
    size_t block_size() const { return block_size_; }

    /**
     * @brief Topology signature: one "index:kind<-inputs" entry per node.
     *
     * Two graphs wired by the same sequence of calls describe identically.
     */
    std::string describe() const {
        std::ostringstream out;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (i > 0) out << ' ';
            out << i << ':' << nodes_[i].processor->kind() << "<-[";
            for (size_t k = 0; k < nodes_[i].inputs.size(); ++k) {
                if (k > 0) out << ',';
                out << nodes_[i].inputs[k];
            }
            out << ']';
        }
        if (has_output_) {
            out << " out=" << output_;
        }
        return out.str();
    }

private:
    enum class Mark { None, Visiting, Done };

    struct Node {
        std::unique_ptr<Processor> processor;
        std::vector<size_t> inputs;
        StereoBlock block;
    };

    size_t index_of(const Processor* node) const {
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (nodes_[i].processor.get() == node) return i;
        }
        throw std::invalid_argument("AudioGraph: unknown node");
    }

    // Post-order DFS: every input lands in order_ before its consumer.
    void visit(size_t idx, std::vector<Mark>& marks) {
        if (marks[idx] == Mark::Done) return;
        if (marks[idx] == Mark::Visiting) {
            throw std::logic_error("AudioGraph: cycle detected");
        }
        marks[idx] = Mark::Visiting;
        for (size_t in : nodes_[idx].inputs) {
            visit(in, marks);
        }
        marks[idx] = Mark::Done;
        order_.push_back(idx);
    }

    void run_block(size_t frames) {
        for (size_t idx : order_) {
            Node& node = nodes_[idx];
            AudioBuffer block = node.block.view(frames);
            block.clear();
            for (size_t in : node.inputs) {
                block.add_from(nodes_[in].block.view(frames));
            }
            node.processor->pull(block);
        }
    }

    size_t block_size_;
    std::vector<Node> nodes_;
    std::vector<size_t> order_;
    size_t output_ = 0;
    bool has_output_ = false;
    bool prepared_ = false;
};

} // namespace morpho

#endif // MORPHO_AUDIO_GRAPH_HPP
