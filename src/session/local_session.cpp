#include "local_session.hpp"
#include "marker_protocol.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

static std::unique_ptr<CompletionDetector> default_detector(const ShellConfig& shell, Clock& clock) {
    return std::make_unique<ProcessTableDetector>(
        platform::list_process_commands, shell.fast_commands, clock,
        std::chrono::milliseconds(FAST_COMMAND_DELAY_MS));
}

LocalSession::LocalSession(ShellConfig shell, Environment environment, Clock& clock)
    : LocalSession(shell, std::move(environment), default_detector(shell, clock), clock) {}

LocalSession::LocalSession(ShellConfig shell, Environment environment,
                           std::unique_ptr<CompletionDetector> detector, Clock& clock)
    : shell_(std::move(shell)), environment_(std::move(environment)), clock_(clock),
      guard_(shell_.interactive_commands), detector_(std::move(detector)) {}

LocalSession::~LocalSession() {
    teardown();
}

std::chrono::milliseconds LocalSession::timeout() const {
    return std::chrono::seconds(shell_.timeout_secs);
}

void LocalSession::setup() {
    if (state_ != SessionState::UNINITIALIZED) {
        throw InvalidSessionState(fmt::format("Session {} is already {}", id_, to_string(state_)));
    }

    hostshell_log(fmt::format("Setting up shell: {} ({})", id_, shell_.program));
    process_ = platform::spawn_piped(shell_.program, shell_.args, environment_);
    if (!process_.valid()) {
        throw SessionError(fmt::format("Failed to start shell '{}': {}",
                                       shell_.program, std::strerror(errno)));
    }
    streams_ = std::make_unique<PipeStreamSource>(process_);
    state_ = SessionState::READY;

    try {
        OutputReader reader(*streams_, *detector_, clock_, timings_);
        auto initial = reader.read("", std::nullopt, std::nullopt, false, timeout());
        hostshell_log(fmt::format("Initial data from session: {} - {} {}",
                                  id_, initial.stdout_data, initial.stderr_data));

        if (!shell_.dev_activate.empty() && fs::exists(shell_.dev_activate)) {
            hostshell_log("Loading development environment");
            execute("source " + shell_.dev_activate);
        }

        for (const auto& [key, value] : environment_) {
            execute(fmt::format("export {}={}", key, value));
            clock_.sleep_for(std::chrono::milliseconds(ENV_SETTLE_MS));
        }
    } catch (const SessionError&) {
        teardown();
        throw;
    }
}

CommandResult LocalSession::execute(const std::string& command, bool wait) {
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);
    require_ready("execute");

    if (guard_.is_interactive(command)) {
        throw InteractiveCommandRejected(command);
    }

    ExecutingScope scope(state_);
    MarkerSet markers = MarkerSet::for_call(id_, ++call_count_);

    // Drain any stale data sitting in the pipes (late output of a previous
    // call that timed out) so this call's reader starts clean
    std::string stale_out = streams_->drain_out();
    std::string stale_err = streams_->drain_err();
    if (!stale_out.empty() || !stale_err.empty()) {
        hostshell_log(fmt::format("{}: discarded stale output stdout({}) stderr({})",
                                  id_, stale_out.size(), stale_err.size()));
    }

    std::string wrapped = build_local_command(command, markers);
    hostshell_log(fmt::format("{} CMD #{}: {}", id_, call_count_, command));
    if (!platform::write_all(process_.stdin_fd(), wrapped)) {
        throw TransportWriteFailed(fmt::format("Failed to write to shell {}: {}",
                                               id_, std::strerror(errno)));
    }

    OutputReader reader(*streams_, *detector_, clock_, timings_);
    StreamOutput raw = reader.read(effective_command(command), markers.command_end,
                                   markers.stderr_end, wait, timeout());

    MarkerResult parsed = extract_exit_code(raw.stdout_data, markers, id_);
    std::string stderr_data = strip_stale_output(
        raw.stderr_data, session_marker_prefix(STDERR_END_PREFIX, id_));

    hostshell_log(fmt::format("{} exit={} stdout({}) stderr({})", id_, parsed.exit_code,
                              parsed.output.size(), stderr_data.size()));
    return CommandResult{parsed.output, stderr_data, parsed.exit_code};
}

void LocalSession::teardown() {
    if (state_ == SessionState::CLOSED) return;

    if (process_.valid()) {
        hostshell_log(fmt::format("Tearing down shell: {} (pid {})", id_, process_.native_handle()));
        process_.kill();
    }
    streams_.reset();
    process_.close_pipes();
    process_ = platform::ProcessHandle();
    state_ = SessionState::CLOSED;
}
