#include "completion_detector.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

bool all_fast_commands(const std::vector<std::string>& clauses,
                       const std::vector<std::string>& fast_commands) {
    bool any = false;
    for (const auto& clause : clauses) {
        std::string program = first_token(clause);
        if (program.empty()) continue;
        any = true;
        if (std::find(fast_commands.begin(), fast_commands.end(), program) == fast_commands.end()) {
            return false;
        }
    }
    return any;
}

// Fast commands are assumed done after `delay`, cut short at the deadline
static void settle(Clock& clock, std::chrono::milliseconds delay, Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock.now());
    if (remaining.count() <= 0) return;
    clock.sleep_for(std::min(delay, remaining));
}

static std::vector<std::string> and_clauses(const std::string& command) {
    std::vector<std::string> clauses;
    for (const auto& part : split_on(command, "&&")) {
        std::string clause = trimmed(part);
        if (!clause.empty()) clauses.push_back(clause);
    }
    return clauses;
}

// ── ProcessTableDetector ─────────────────────────────────────

ProcessTableDetector::ProcessTableDetector(ProcessLister lister,
                                           std::vector<std::string> fast_commands,
                                           Clock& clock,
                                           std::chrono::milliseconds fast_delay)
    : lister_(std::move(lister)), fast_commands_(std::move(fast_commands)),
      clock_(clock), fast_delay_(fast_delay) {}

bool ProcessTableDetector::has_exited(const std::string& command, Clock::time_point deadline) {
    auto clauses = and_clauses(command);
    if (clauses.empty()) return true;

    if (all_fast_commands(clauses, fast_commands_)) {
        settle(clock_, fast_delay_, deadline);
        return true;
    }

    for (const auto& line : lister_()) {
        std::string process = trimmed(line);
        for (const auto& clause : clauses) {
            if (process == clause || starts_with(process, clause + " ")) {
                return false;
            }
        }
    }
    return true;
}

// ── RemoteProcessDetector ────────────────────────────────────

RemoteProcessDetector::RemoteProcessDetector(RemoteLister lister,
                                             std::vector<std::string> fast_commands,
                                             Clock& clock,
                                             std::chrono::milliseconds fast_delay)
    : lister_(std::move(lister)), fast_commands_(std::move(fast_commands)),
      clock_(clock), fast_delay_(fast_delay) {}

bool RemoteProcessDetector::has_exited(const std::string& clause, Clock::time_point deadline) {
    std::string cmd = trimmed(clause);
    if (cmd.empty()) return true;

    // A bare program name would suffix-match unrelated processes (e.g. every
    // "bash" line), so single-word clauses count as fast too.
    if (all_fast_commands({cmd}, fast_commands_) || cmd.find(' ') == std::string::npos) {
        settle(clock_, fast_delay_, deadline);
        return true;
    }

    for (const auto& line : split_lines(lister_())) {
        if (ends_with(trimmed(line), cmd)) {
            hostshell_log(fmt::format("remote: still running: {}", trimmed(line)));
            return false;
        }
    }
    return true;
}
