#include "hostshell_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <session/local_session.hpp>
#include <session/remote_session.hpp>
#include <ssh/ssh_host.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <readline/readline.h>
#include <readline/history.h>

HostshellCLI::HostshellCLI(Config config) : config_(std::move(config)) {
    const auto& logging = config_.logging();
    set_log_enabled(logging.enabled);
    if (!logging.path.empty()) set_log_path(logging.path);
    register_builtins();
}

void HostshellCLI::register_builtins() {
    builtins_["help"] = {[this](const std::string&) { print_help(); },
                         "Show this help message"};
    builtins_["quit"] = {[this](const std::string&) { running_ = false; },
                         "Close the session and exit"};
    builtins_["exit"] = {[this](const std::string&) { running_ = false; },
                         "Close the session and exit"};
    builtins_["clear"] = {[](const std::string&) { std::cout << "\033[2J\033[H" << std::flush; },
                          "Clear the screen"};
}

void HostshellCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : builtins_) {
        std::cout << theme::color::BLUE << fmt::format("    {:<14}", name)
                  << theme::color::RESET << theme::dim(entry.second) << "\n";
    }
    std::cout << theme::dim("    Anything else is run in the shell session.") << "\n\n";
}

std::string HostshellCLI::get_prompt_string(const std::string& where) const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    return rl_esc(theme::color::BROWN) + "hostshell"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::GREEN) + where
         + rl_esc(theme::color::RESET) + "> ";
}

static void print_output(const std::string& out, const std::string& err) {
    std::cout << out;
    if (!out.empty() && out.back() != '\n') std::cout << "\n";
    if (!err.empty()) {
        std::cout << theme::color::RED << err << theme::color::RESET;
        if (err.back() != '\n') std::cout << "\n";
    }
    std::cout << std::flush;
}

bool HostshellCLI::run_line(Session& session, const std::string& line) {
    try {
        auto result = session.execute(line);
        print_output(result.stdout_data, result.stderr_data);
        if (!result.success()) {
            std::cout << theme::dim(fmt::format("[exit {}]", result.exit_code)) << "\n";
        }
        return true;
    } catch (const InteractiveCommandRejected& e) {
        std::cout << theme::fail(e.what());
        return true;
    } catch (const ReadTimeout& e) {
        print_output(e.stdout_data(), e.stderr_data());
        std::cout << theme::fail("Command timed out.");
        std::cout << theme::dim("    Interactive commands are not supported; use a "
                                "non-interactive equivalent.") << "\n";
        return true;
    } catch (const ProcessExited& e) {
        print_output(e.stdout_data(), e.stderr_data());
        std::cout << theme::fail("The shell exited.");
        return false;
    } catch (const SessionError& e) {
        std::cout << theme::fail(e.what());
        return false;
    }
}

void HostshellCLI::repl(Session& session, const std::string& where) {
    std::cout << theme::ok(fmt::format("Session {} ready", session.id()));
    std::cout << theme::dim("    Type 'help' for commands, 'exit' to quit.") << "\n\n";

    running_ = true;
    std::string line;
    while (running_) {
        std::string prompt = get_prompt_string(where);
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (trimmed(line).empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        auto it = builtins_.find(command);
        if (it != builtins_.end()) {
            std::string args;
            std::getline(iss, args);
            it->second.first(trimmed(args));
            continue;
        }

        if (!run_line(session, line)) break;
    }

    std::cout << theme::dim("Closing session...") << "\n";
    session.teardown();
}

int HostshellCLI::run_local_repl() {
    std::cout << theme::banner();
    LocalSession session(config_.shell(), config_.environment());
    session.setup();
    repl(session, "local");
    return 0;
}

int HostshellCLI::run_remote_repl() {
    std::cout << theme::banner();
    const auto& remote = config_.remote();
    if (remote.host.empty()) {
        std::cout << theme::fail("No remote host configured.");
        std::cout << theme::step(fmt::format("Add a 'remote:' section to {}",
                                             get_global_config_path().string()));
        return 1;
    }

    SshHost host(remote);
    auto connected = host.connect([](const std::string& msg) {
        std::cout << theme::info(msg);
    });
    if (connected.failed()) {
        std::cout << theme::fail(connected.get_output());
        return 1;
    }
    std::cout << theme::ok("Connected to " + host.target());

    {
        RemoteSession session(host, config_.shell(), config_.environment());
        session.setup();
        repl(session, remote.host);
    }
    host.close();
    return 0;
}

int HostshellCLI::run_exec(const std::string& command) {
    LocalSession session(config_.shell(), config_.environment());
    session.setup();
    try {
        auto result = session.execute(command);
        std::cout << result.stdout_data << std::flush;
        std::cerr << result.stderr_data << std::flush;
        session.teardown();
        return result.exit_code;
    } catch (const PartialOutputError& e) {
        std::cout << e.stdout_data() << std::flush;
        std::cerr << e.stderr_data() << std::flush;
        throw;
    }
}
