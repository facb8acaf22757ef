/**
 * @file Processor.hpp
 * @brief Base class for signal graph nodes.
 *
 * - Separation of Concerns: DSP nodes know nothing about devices, files or
 *   the engine; they only transform the block they are handed.
 * - In-place model: the graph sums a node's inputs into the node's block,
 *   then the node processes that block in place.
 */

#ifndef MORPHO_PROCESSOR_HPP
#define MORPHO_PROCESSOR_HPP

#include <cstddef>
#include "AudioBuffer.hpp"

namespace morpho {

/**
 * @brief Base class for audio processing units.
 *
 * Concrete nodes (filters, gains, panners, delays, sources) inherit from this
 * class and implement do_pull(). Source nodes receive a cleared block and fill
 * it; every other node receives the sum of its inputs and processes in place.
 */
class Processor {
public:
    virtual ~Processor() = default;

    /**
     * @brief Process one stereo block in place.
     *
     * @param output Block holding the summed inputs on entry, the node output on exit.
     */
    void pull(AudioBuffer& output) {
        do_pull(output);
    }

    /**
     * @brief Reset internal state (filter memories, delay lines, smoothers).
     */
    virtual void reset() = 0;

    /**
     * @brief Short node kind used for topology descriptions ("biquad", "gain", ...).
     */
    virtual const char* kind() const = 0;

protected:
    /**
     * @brief Subclasses implement the actual processing.
     */
    virtual void do_pull(AudioBuffer& output) = 0;
};

} // namespace morpho

#endif // MORPHO_PROCESSOR_HPP
