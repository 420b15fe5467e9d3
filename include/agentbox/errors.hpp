#ifndef AGENTBOX_ERRORS_HPP
#define AGENTBOX_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace agentbox {

// Base class for exceptions raised by the library itself
class AgentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by a body to leave because its agent is shutting down.
// Agent::Stop() treats this outcome as expected and does not rethrow it.
class OperationCancelled : public AgentError {
public:
    OperationCancelled()
        : AgentError("operation cancelled") {}

    explicit OperationCancelled(const std::string& what)
        : AgentError(what) {}
};

// True if `error` holds an OperationCancelled
[[nodiscard]] bool IsCancellation(const std::exception_ptr& error) noexcept;

// Best-effort what() of a captured exception, for logging
[[nodiscard]] std::string Describe(const std::exception_ptr& error);

} // namespace agentbox

#endif // AGENTBOX_ERRORS_HPP
