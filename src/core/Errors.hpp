/**
 * @file Errors.hpp
 * @brief Exception types raised by the engine core.
 */

#ifndef MORPHO_ERRORS_HPP
#define MORPHO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace morpho {

/**
 * @brief Input bytes are not a WAV stream the decoder understands.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what)
        : std::runtime_error("decode: " + what)
    {}
};

/**
 * @brief Offline rendering did not produce a result.
 */
class RenderError : public std::runtime_error {
public:
    enum class Reason {
        ContextAllocation,
        Cancelled,
        Busy
    };

    RenderError(Reason reason, const std::string& what)
        : std::runtime_error("render: " + what)
        , reason_(reason)
    {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

inline const char* render_error_reason_name(RenderError::Reason reason) {
    switch (reason) {
        case RenderError::Reason::ContextAllocation: return "context-allocation";
        case RenderError::Reason::Cancelled: return "cancelled";
        case RenderError::Reason::Busy: return "busy";
    }
    return "unknown";
}

} // namespace morpho

#endif // MORPHO_ERRORS_HPP
