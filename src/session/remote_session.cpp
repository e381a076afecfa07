#include "remote_session.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

static std::unique_ptr<CompletionDetector> default_detector(RemoteHost& host,
                                                            const ShellConfig& shell,
                                                            Clock& clock) {
    auto lister = [&host]() {
        auto result = host.exec(REMOTE_PS_COMMAND);
        if (result.failed()) {
            hostshell_log(fmt::format("remote: process listing failed: {}", result.get_output()));
        }
        return result.stdout_data;
    };
    return std::make_unique<RemoteProcessDetector>(
        lister, shell.fast_commands, clock, std::chrono::milliseconds(FAST_COMMAND_DELAY_MS));
}

static bool parse_status_line(const std::string& line, int& out) {
    std::string token = trimmed(line);
    if (token.empty()) return false;
    size_t i = (token[0] == '-') ? 1 : 0;
    if (i == token.size()) return false;
    for (; i < token.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) return false;
    }
    out = safe_stoi(token, 1);
    return true;
}

// The answer to a status query is the first non-empty line after the echoed
// query (or the first non-empty line if the shell did not echo). Anything
// after it, such as a prompt, is ignored.
static std::optional<std::string> status_line(const std::vector<std::string>& lines) {
    size_t start = 0;
    for (size_t i = lines.size(); i > 0; i--) {
        if (ends_with(trimmed(lines[i - 1]), REMOTE_STATUS_COMMAND)) {
            start = i;
            break;
        }
    }
    for (size_t i = start; i < lines.size(); i++) {
        std::string line = trimmed(lines[i]);
        if (!line.empty()) return line;
    }
    return std::nullopt;
}

// Newline-terminated lines only; a trailing partial line may still grow
static std::vector<std::string> complete_lines(const std::string& text) {
    auto last_nl = text.rfind('\n');
    if (last_nl == std::string::npos) return {};
    return split_lines(text.substr(0, last_nl + 1));
}

int parse_status_response(const std::string& response) {
    auto line = status_line(split_lines(response));
    int code = 1;
    if (!line || !parse_status_line(*line, code)) return 1;
    return code;
}

RemoteSession::RemoteSession(RemoteHost& host, ShellConfig shell, Environment environment,
                             Clock& clock)
    : RemoteSession(host, shell, std::move(environment),
                    default_detector(host, shell, clock), clock) {}

RemoteSession::RemoteSession(RemoteHost& host, ShellConfig shell, Environment environment,
                             std::unique_ptr<CompletionDetector> detector, Clock& clock)
    : host_(host), shell_(std::move(shell)), environment_(std::move(environment)),
      clock_(clock), guard_(shell_.interactive_commands), detector_(std::move(detector)) {}

RemoteSession::~RemoteSession() {
    teardown();
}

Clock::time_point RemoteSession::deadline() const {
    return clock_.now() + std::chrono::seconds(shell_.timeout_secs);
}

void RemoteSession::setup() {
    if (state_ != SessionState::UNINITIALIZED) {
        throw InvalidSessionState(fmt::format("Session {} is already {}", id_, to_string(state_)));
    }

    hostshell_log(fmt::format("Setting up remote shell: {}", id_));
    auto opened = host_.open_shell(environment_);
    if (opened.is_err() || !opened.value) {
        throw TransportWriteFailed("Failed to open remote shell channel: " + opened.error);
    }
    channel_ = std::move(opened.value);
    state_ = SessionState::READY;

    try {
        std::string initial = drain();
        hostshell_log(fmt::format("Initial data from session: {} - {}", id_, initial));

        // The activation file lives on the remote host, so check it there
        if (!shell_.dev_activate.empty() &&
            host_.exec("test -e " + shell_.dev_activate).success()) {
            hostshell_log("Loading development environment");
            execute("source " + shell_.dev_activate);
        }

        for (const auto& [key, value] : environment_) {
            send(fmt::format("export {}={}", key, value));
            clock_.sleep_for(std::chrono::milliseconds(ENV_SETTLE_MS));
            drain();
        }

        execute(REMOTE_PROMPT_RESET);
    } catch (const SessionError&) {
        teardown();
        throw;
    }
}

void RemoteSession::check_open(const std::string& partial) {
    if (channel_->eof()) {
        hostshell_log(fmt::format("{}: remote channel closed", id_));
        throw ProcessExited("Remote shell channel closed unexpectedly.\nCurrent output: " + partial,
                            partial, "");
    }
}

void RemoteSession::send(const std::string& line) {
    if (!channel_->send(line + "\n")) {
        throw TransportWriteFailed(fmt::format("Failed to send to remote shell {}", id_));
    }
    clock_.sleep_for(std::chrono::milliseconds(SEND_SETTLE_MS));
}

std::string RemoteSession::drain() {
    std::string output;
    while (channel_->recv_ready()) {
        std::string chunk = channel_->recv(CHANNEL_RECV_BUF_SIZE);
        if (chunk.empty()) break;
        output += chunk;
    }
    while (channel_->recv_stderr_ready()) {
        std::string chunk = channel_->recv_stderr(CHANNEL_RECV_BUF_SIZE);
        if (chunk.empty()) break;
        output += chunk;
    }
    return strip_escape_sequences(output);
}

std::string RemoteSession::read_available(Clock::time_point deadline) {
    while (clock_.now() < deadline &&
           !channel_->recv_ready() && !channel_->recv_stderr_ready()) {
        if (channel_->eof()) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now());
        clock_.sleep_for(std::min(std::chrono::milliseconds(READ_PAUSE_MS), remaining));
    }
    return drain();
}

std::string RemoteSession::sanitize(const std::string& output) const {
    auto lines = split_on(output, "\r\n");
    std::string clean;
    for (size_t i = 1; i < lines.size(); i++) {
        if (i > 1) clean += "\n";
        clean += rtrimmed(lines[i]);
    }
    if (!clean.empty() && clean[0] == '\r') clean.erase(0, 1);

    if (!shell_.activation_banner.empty()) {
        const std::string banner = shell_.activation_banner + "\n";
        size_t pos;
        while ((pos = clean.find(banner)) != std::string::npos) {
            clean.erase(pos, banner.size());
        }
    }
    return clean;
}

void RemoteSession::wait_for(const std::string& clause, Clock::time_point deadline,
                             const std::string& partial) {
    while (!detector_->has_exited(clause, deadline)) {
        check_open(partial);
        if (clock_.now() >= deadline) {
            std::string pending = partial + sanitize(drain());
            hostshell_log(fmt::format("{}: timeout waiting for '{}'", id_, clause));
            throw ReadTimeout(
                fmt::format("Timeout reached while waiting for remote command '{}'.\n"
                            "Current output: {}\n"
                            "Note that interactive commands are not supported and can time out. "
                            "Use a corresponding non-interactive command if possible.",
                            clause, pending),
                pending, "");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now());
        clock_.sleep_for(std::min(std::chrono::milliseconds(REMOTE_COMPLETION_RETRY_MS), remaining));
    }
}

int RemoteSession::exit_status(Clock::time_point deadline) {
    send(REMOTE_STATUS_COMMAND);

    const auto until = std::min(deadline,
                                clock_.now() + std::chrono::milliseconds(STATUS_READ_TIMEOUT_MS));
    std::string response;
    while (true) {
        response += read_available(until);
        auto line = status_line(complete_lines(response));
        if (line) {
            int code = 1;
            if (!parse_status_line(*line, code)) {
                hostshell_log(fmt::format("{}: unparsable status line: {}", id_, *line));
            }
            return code;
        }
        if (clock_.now() >= until || channel_->eof()) {
            hostshell_log(fmt::format("{}: no status response: {}", id_, response));
            return 1;
        }
    }
}

CommandResult RemoteSession::execute(const std::string& command, bool wait) {
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);
    require_ready("execute");

    if (guard_.is_interactive(command)) {
        throw InteractiveCommandRejected(command);
    }

    ExecutingScope scope(state_);
    hostshell_log(fmt::format("{} CMD: {}", id_, command));

    std::vector<std::string> clauses;
    for (const auto& part : split_on(command, "&&")) {
        std::string clause = trimmed(part);
        if (!clause.empty()) clauses.push_back(clause);
    }
    if (clauses.empty()) clauses.push_back("");

    const auto until = deadline();
    std::string output;
    for (const auto& clause : clauses) {
        send(clause);
        if (wait) wait_for(clause, until, output);
        check_open(output);
        output += sanitize(read_available(until));
    }

    int code = exit_status(deadline());
    hostshell_log(fmt::format("{} exit={} stdout({})", id_, code, output.size()));
    return CommandResult{output, "", code};
}

void RemoteSession::teardown() {
    if (state_ == SessionState::CLOSED) return;
    if (channel_) {
        hostshell_log(fmt::format("Closing remote shell: {}", id_));
        channel_->close();
        channel_.reset();
    }
    state_ = SessionState::CLOSED;
}
