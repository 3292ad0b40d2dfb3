#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include "JOSHC.hpp"
#include <stdexcept>
#include <string>

namespace JOSHC {

/**
 * @brief Malformed engine value, coordinate string or wire line
 *
 * Always carries the raw text that failed to parse.
 */
class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& message, const std::string& raw_text)
        : std::runtime_error(message + ": " + raw_text), raw_text_(raw_text) {}

    const std::string& getRawText() const { return raw_text_; }

private:
    std::string raw_text_;
};

/**
 * @brief Well-formed line that is not legal in the current reader state
 *
 * For example an end marker for a replicate that never produced data, or
 * data for a replicate that has already completed.
 */
class ProtocolViolation : public std::runtime_error {
public:
    ProtocolViolation(const std::string& message, ReplicateId replicate)
        : std::runtime_error(message), replicate_(replicate) {}

    ReplicateId getReplicate() const { return replicate_; }

private:
    ReplicateId replicate_;
};

class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Failure reported by the engine itself through an "[error]" line
 */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace JOSHC

#endif // EXCEPTIONS_HPP
