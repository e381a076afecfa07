#pragma once

constexpr const char* HOSTSHELL_VERSION = "0.1.0";

// ── Shell defaults ──────────────────────────────────────────
constexpr const char* DEFAULT_SHELL_PROGRAM   = "/bin/bash";
constexpr const char* DEFAULT_DEV_ACTIVATE    = "/home/user/.dev/bin/activate";
constexpr const char* DEFAULT_ACTIVATION_BANNER = "(.dev)";

// Non-exhaustive list of interactive invocations rejected before sending
inline constexpr const char* DEFAULT_INTERACTIVE_COMMANDS[] = {
    "tail -f", "watch", "top", "htop", "less", "more", "vim", "nano", "vi",
};

// Commands that return near-instantly; completion polling is skipped for them
inline constexpr const char* DEFAULT_FAST_COMMANDS[] = {"cd", "ls", "pwd"};

// ── Timeouts ────────────────────────────────────────────────
constexpr int EXEC_TIMEOUT_SECS          = 120;   // Max time for a single execute()
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_EXEC_TIMEOUT_SECS      = 30;    // Side-channel one-off commands

// ── Polling intervals ───────────────────────────────────────
constexpr int READ_POLL_MS               = 100;   // poll() wait on the stream pair
constexpr int READ_PAUSE_MS              = 50;    // pause between read iterations
constexpr int COMPLETION_RETRY_MS        = 500;   // local wait before re-checking ps
constexpr int REMOTE_COMPLETION_RETRY_MS = 300;   // remote wait before re-checking ps
constexpr int FAST_COMMAND_DELAY_MS      = 300;   // assumed runtime of a fast command
constexpr int ENV_SETTLE_MS              = 50;    // pause after each export at setup
constexpr int SEND_SETTLE_MS             = 50;    // pause after each remote send
constexpr int STATUS_READ_TIMEOUT_MS     = 3000;  // wait for the answer to `echo $?`

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE         = 4096;
constexpr int CHANNEL_RECV_BUF_SIZE      = 512;
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Marker prefixes ─────────────────────────────────────────
constexpr const char* CMD_END_PREFIX     = "__CMD_END";
constexpr const char* STDERR_END_PREFIX  = "__STDERR_END";
constexpr const char* EXIT_PREFIX        = "__EXIT";

// ── Remote helper commands ──────────────────────────────────
constexpr const char* REMOTE_PS_COMMAND      = "ps -eo command";
constexpr const char* REMOTE_STATUS_COMMAND  = "echo $?";
constexpr const char* REMOTE_PROMPT_RESET    = "cd ~/ && export PS1=''";

// ── SSH transport ───────────────────────────────────────────
constexpr const char* SSH_PTY_TERM       = "vt100";
constexpr int SSH_PTY_COLS               = 200;
constexpr int SSH_PTY_ROWS               = 50;
constexpr int SSH_RETRY_MS               = 10;    // wait between EAGAIN retries
constexpr int SSH_WRITE_RETRIES          = 100;
constexpr int SSH_KEEPALIVE_SECS         = 30;
