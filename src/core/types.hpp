#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One-off SSH command result (side-channel exec, transport setup)
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Result of Session::execute(). Built fresh per call.
struct CommandResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 1;

    bool success() const { return exit_code == 0; }
};

// Ordered variable name -> value mapping applied at session setup
using Environment = std::map<std::string, std::string>;

// ── Configuration structures ────────────────────────────────

struct ShellConfig {
    std::string program;
    std::vector<std::string> args;
    int timeout_secs = EXEC_TIMEOUT_SECS;        // per execute() call
    std::string dev_activate;                    // sourced at setup if it exists
    std::string activation_banner;               // stripped from remote output
    std::vector<std::string> interactive_commands;
    std::vector<std::string> fast_commands;      // assumed to exit near-instantly
};

struct RemoteConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;                            // connect timeout, seconds
};

struct LoggingConfig {
    bool enabled = true;
    std::string path;                            // empty = <tmp>/hostshell_debug.log
};

// Status callback for long-running transport operations
using StatusCallback = std::function<void(const std::string&)>;
