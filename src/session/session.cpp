#include "session.hpp"
#include <core/errors.hpp>
#include <core/session_id.hpp>
#include <fmt/format.h>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::UNINITIALIZED: return "uninitialized";
        case SessionState::READY:         return "ready";
        case SessionState::EXECUTING:     return "executing";
        case SessionState::CLOSED:        return "closed";
    }
    return "unknown";
}

Session::Session() : id_(generate_session_id()) {}

void Session::require_ready(const char* operation) const {
    if (state_ != SessionState::READY) {
        throw InvalidSessionState(fmt::format("Cannot {} on session {} in state '{}'",
                                              operation, id_, to_string(state_)));
    }
}

ExecutingScope::ExecutingScope(SessionState& state) : state_(state) {
    state_ = SessionState::EXECUTING;
}

ExecutingScope::~ExecutingScope() {
    if (state_ == SessionState::EXECUTING) state_ = SessionState::READY;
}
