#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace core {

/**
 * @brief Error value delivered to listeners through the errored event
 */
struct SpeechError {
    enum class Kind {
        Configuration,     ///< Invalid or missing option
        State,             ///< Illegal transition or contract violation
        Backend,           ///< Terminal recognition provider failure
        ResourceTimeout    ///< Bounded lock wait expired
    };

    Kind kind = Kind::State;
    std::string message;   ///< Human-readable description
    std::string details;   ///< Component or provider specific context
    int code = 0;          ///< Provider error code, 0 if none

    SpeechError() = default;
    SpeechError(Kind k, std::string msg, std::string det = std::string(), int c = 0)
        : kind(k), message(std::move(msg)), details(std::move(det)), code(c) {}

    std::string to_string() const;
};

const char* to_string(SpeechError::Kind kind);

/**
 * @brief Thrown when the pipeline cannot be built from its configuration
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace core
