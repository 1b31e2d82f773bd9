#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace data_agent {

// Root of every failure the agent raises on purpose. Anything that is not an
// AgentError reaching the HTTP layer is reported as an unknown fault.
class AgentError : public std::runtime_error {
public:
    explicit AgentError(const std::string& msg) : std::runtime_error(msg) {}
};

// Required caller input is missing or unusable.
class ValidationError : public AgentError {
public:
    using AgentError::AgentError;
};

// Base image, unit creation or file injection failed.
class ProvisioningError : public AgentError {
public:
    using AgentError::AgentError;
};

// A code unit could not be started, its output could not be captured, it ran
// past its own timeout, or it exited non-zero while that is treated as fatal.
class ExecutionError : public AgentError {
public:
    ExecutionError(const std::string& msg, int exit_code = -1, std::string output = {}, bool timed_out = false)
        : AgentError(msg), exit_code_(exit_code), output_(std::move(output)), timed_out_(timed_out) {}

    int exit_code() const { return exit_code_; }
    const std::string& output() const { return output_; }
    bool timed_out() const { return timed_out_; }

private:
    int exit_code_;
    std::string output_;
    bool timed_out_;
};

// Provider output did not have the expected shape. Always recovered locally.
class ParseError : public AgentError {
public:
    using AgentError::AgentError;
};

// End-to-end request deadline exceeded.
class TimeoutError : public AgentError {
public:
    using AgentError::AgentError;
};

// Transport or HTTP failure talking to the reasoning provider.
class ProviderError : public AgentError {
public:
    ProviderError(const std::string& msg, long status_code = 0)
        : AgentError(msg), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

}
