#pragma once

#include <stdexcept>
#include <string>

// Base class for everything Session::execute() and setup() can throw.
class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Guard matched a known interactive program. Nothing was written.
class InteractiveCommandRejected : public SessionError {
public:
    explicit InteractiveCommandRejected(const std::string& command)
        : SessionError("Interactive commands are not supported. Command '" + command +
                       "' appears to be interactive."),
          command_(command) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

// Write to a closed or broken transport. Fatal for the session.
class TransportWriteFailed : public SessionError {
public:
    using SessionError::SessionError;
};

// execute() called outside the Ready state (before setup, after teardown).
class InvalidSessionState : public SessionError {
public:
    using SessionError::SessionError;
};

// Read failures carry whatever was buffered before the failure.
class PartialOutputError : public SessionError {
public:
    PartialOutputError(const std::string& message,
                       std::string stdout_data, std::string stderr_data)
        : SessionError(message),
          stdout_data_(std::move(stdout_data)),
          stderr_data_(std::move(stderr_data)) {}

    const std::string& stdout_data() const { return stdout_data_; }
    const std::string& stderr_data() const { return stderr_data_; }

private:
    std::string stdout_data_;
    std::string stderr_data_;
};

// The shell process (or remote channel) went away mid-read.
class ProcessExited : public PartialOutputError {
public:
    using PartialOutputError::PartialOutputError;
};

// No completion signal within the timeout. The transport stays alive.
class ReadTimeout : public PartialOutputError {
public:
    using PartialOutputError::PartialOutputError;
};
