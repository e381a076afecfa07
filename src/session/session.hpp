#pragma once

#include <mutex>
#include <string>
#include <core/types.hpp>

enum class SessionState {
    UNINITIALIZED,
    READY,
    EXECUTING,
    CLOSED,
};

const char* to_string(SessionState state);

// A persistent shell against which commands run one at a time.
//
// Lifecycle: setup() once, any number of execute() calls, teardown().
// execute() is only valid in READY. teardown() is valid in any state and
// may be called more than once.
class Session {
public:
    Session();
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    virtual void setup() = 0;
    virtual void teardown() = 0;

    // Run one command and collect its output and exit code.
    // Throws InteractiveCommandRejected, TransportWriteFailed, ProcessExited,
    // ReadTimeout or InvalidSessionState.
    virtual CommandResult execute(const std::string& command, bool wait = true) = 0;

    const std::string& id() const { return id_; }
    SessionState state() const { return state_; }

protected:
    std::string id_;
    SessionState state_ = SessionState::UNINITIALIZED;

    // Serializes execute() calls sharing this session's transport
    std::mutex cmd_mutex_;

    // Throws InvalidSessionState unless the session is READY
    void require_ready(const char* operation) const;
};

// Marks a session EXECUTING for the lifetime of the guard, then READY again
// unless the session was closed in the meantime.
class ExecutingScope {
public:
    explicit ExecutingScope(SessionState& state);
    ~ExecutingScope();

    ExecutingScope(const ExecutingScope&) = delete;
    ExecutingScope& operator=(const ExecutingScope&) = delete;

private:
    SessionState& state_;
};
