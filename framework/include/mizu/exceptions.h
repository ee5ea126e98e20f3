#ifndef MIZU_EXCEPTIONS_H
#define MIZU_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <cstddef>

namespace mizu {

/**
 * @brief Base class for all routing errors raised by Mizu.
 */
class RoutingError : public std::runtime_error {
public:
    explicit RoutingError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Raised by strict-mode registration when a path pattern is ambiguous or malformed.
 */
class InvalidPattern : public RoutingError {
    std::string pattern_;
public:
    InvalidPattern(const std::string& pattern, const std::string& reason)
        : RoutingError("Invalid route pattern '" + pattern + "': " + reason), pattern_(pattern) {}

    const std::string& pattern() const { return pattern_; }
};

/**
 * @brief A middleware invoked its continuation more than once.
 *
 * This is a bug in the middleware, not a request condition, so the dispatcher
 * never turns it into a response.
 */
class NextCalledTwice : public std::logic_error {
    std::size_t step_;
public:
    explicit NextCalledTwice(std::size_t step)
        : std::logic_error("next() called multiple times"), step_(step) {}

    std::size_t step() const { return step_; }
};

} // namespace mizu

#endif
