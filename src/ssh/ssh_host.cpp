#include "ssh_host.hpp"
#include "ssh_shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <mutex>

// Passed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Every prompt gets the configured password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static void init_libssh2() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

SshHost::SshHost(const RemoteConfig& config)
    : config_(config), io_mutex_(std::make_shared<std::mutex>()) {}

SshHost::~SshHost() {
    close();
}

SSHResult SshHost::connect(StatusCallback callback) {
    if (session_) return SSHResult{0, "", ""};
    if (config_.host.empty()) return SSHResult{-1, "", "No remote host configured"};

    if (callback) callback("Connecting to " + config_.host + "...");
    init_libssh2();

    auto sock = platform::connect_tcp(config_.host, config_.port, config_.timeout);
    if (sock.is_err()) {
        hostshell_log("ssh: " + sock.error);
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return SSHResult{-1, "", "Failed to create SSH session"};
    }
    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }
    if (ret != 0) {
        close();
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = authenticate(callback);
    if (auth_result.failed()) {
        close();
        return auth_result;
    }

    target_str_ = fmt::format("{}@{}:{}", config_.user, config_.host, config_.port);
    hostshell_log("ssh: connected to " + target_str_);
    if (callback) callback("Connected to " + config_.host);
    return SSHResult{0, "", ""};
}

SSHResult SshHost::authenticate(StatusCallback callback) {
    int ret;
    const std::string& user = config_.user;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};  // server accepted "none"
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_RETRY_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    hostshell_log("ssh: auth methods: " + methods);

    if (config_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key auth...");
        const char* passphrase = config_.password.empty() ? nullptr : config_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, user.c_str(), static_cast<unsigned int>(user.length()),
                    nullptr, config_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_RETRY_MS);
        }
        if (ret == 0) return SSHResult{0, "", ""};
        hostshell_log(fmt::format("ssh: public key auth with {} failed ({})",
                                  *config_.ssh_key_path, ret));
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{config_.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(
                    session_, user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_RETRY_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return SSHResult{0, "", ""};
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                                config_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_RETRY_MS);
        }
        if (ret == 0) return SSHResult{0, "", ""};
    }

    return SSHResult{-1, "", "Authentication failed (check user, password or key)"};
}

LIBSSH2_CHANNEL* SshHost::open_channel() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_EXEC_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
            if (ch) return ch;
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) return nullptr;
        }
        platform::sleep_ms(SSH_RETRY_MS);
    }
    return nullptr;
}

void SshHost::free_channel(LIBSSH2_CHANNEL* ch) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(ch);
    libssh2_channel_free(ch);
}

Result<std::unique_ptr<RemoteChannel>> SshHost::open_shell(const Environment& env) {
    using ShellResult = Result<std::unique_ptr<RemoteChannel>>;
    if (!session_) return ShellResult::Err("Not connected");

    LIBSSH2_CHANNEL* ch = open_channel();
    if (!ch) return ShellResult::Err("Failed to open SSH channel");

    // Servers may refuse variables outside AcceptEnv; the exports at setup
    // cover those.
    for (const auto& [key, value] : env) {
        int rc;
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_setenv_ex(ch, key.c_str(), static_cast<unsigned int>(key.size()),
                                           value.c_str(), static_cast<unsigned int>(value.size()));
        } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(SSH_RETRY_MS), true));
        if (rc != 0) hostshell_log(fmt::format("ssh: server refused env {} ({})", key, rc));
    }

    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_request_pty_ex(ch, SSH_PTY_TERM,
                                            static_cast<unsigned int>(std::strlen(SSH_PTY_TERM)),
                                            nullptr, 0, SSH_PTY_COLS, SSH_PTY_ROWS, 0, 0);
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(SSH_RETRY_MS), true));
    if (rc != 0) {
        free_channel(ch);
        return ShellResult::Err("Failed to request PTY");
    }

    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_shell(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(SSH_RETRY_MS), true));
    if (rc != 0) {
        free_channel(ch);
        return ShellResult::Err("Failed to request shell");
    }

    return ShellResult::Ok(std::make_unique<SshShellChannel>(ch, io_mutex_));
}

SSHResult SshHost::exec(const std::string& command) {
    if (!session_) return SSHResult{-1, "", "Not connected"};

    LIBSSH2_CHANNEL* ch = open_channel();
    if (!ch) return SSHResult{-1, "", "Failed to open exec channel"};

    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_exec(ch, command.c_str());
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(SSH_RETRY_MS), true));
    if (rc != 0) {
        free_channel(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Read both streams until the remote side closes
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_EXEC_TIMEOUT_SECS);
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) output.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch) != 0;
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            free_channel(ch);
            return SSHResult{-1, output, "SSH channel read error"};
        }
        if (n_out > 0 || n_err > 0) continue;
        if (eof) {
            timed_out = false;
            break;
        }
        platform::poll_socket(sock_, POLLIN, SSH_RETRY_MS);
    }

    if (timed_out) {
        free_channel(ch);
        return SSHResult{-1, output,
                         fmt::format("Command timed out after {}s", SSH_EXEC_TIMEOUT_SECS)};
    }

    int exit_status = -1;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(SSH_RETRY_MS), true));
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (rc == 0) exit_status = libssh2_channel_get_exit_status(ch);
        libssh2_channel_free(ch);
    }

    return SSHResult{exit_status, output, stderr_data};
}

void SshHost::close() {
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
