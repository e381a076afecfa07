#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

// Applies a parsed YAML document on top of an existing Config.
// Keys that are absent leave the current value untouched.
class ConfigReader {
public:
    static void apply(Config& config, const YAML::Node& root) {
        if (!root || root.IsNull()) return;
        if (!root.IsMap()) {
            throw std::runtime_error("top-level document must be a mapping");
        }

        if (const auto shell = root["shell"]) apply_shell(config.shell_, shell);

        if (const auto env = root["environment"]) {
            for (const auto& kv : env) {
                config.environment_[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
        }

        if (const auto remote = root["remote"]) apply_remote(config.remote_, remote);

        if (const auto logging = root["logging"]) {
            config.logging_.enabled = logging["enabled"].as<bool>(config.logging_.enabled);
            if (logging["path"]) {
                config.logging_.path = expand_home(logging["path"].as<std::string>());
            }
        }
    }

private:
    static void apply_shell(ShellConfig& s, const YAML::Node& node) {
        s.program = node["program"].as<std::string>(s.program);
        if (node["args"]) s.args = node["args"].as<std::vector<std::string>>();
        s.timeout_secs = node["timeout"].as<int>(s.timeout_secs);
        if (node["dev_activate"]) s.dev_activate = expand_home(node["dev_activate"].as<std::string>());
        s.activation_banner = node["activation_banner"].as<std::string>(s.activation_banner);
        if (node["interactive_commands"]) {
            s.interactive_commands = node["interactive_commands"].as<std::vector<std::string>>();
        }
        if (node["fast_commands"]) {
            s.fast_commands = node["fast_commands"].as<std::vector<std::string>>();
        }
    }

    static void apply_remote(RemoteConfig& r, const YAML::Node& node) {
        r.host = node["host"].as<std::string>(r.host);
        r.port = node["port"].as<int>(r.port);
        r.user = node["user"].as<std::string>(r.user);
        r.password = node["password"].as<std::string>(r.password);
        r.timeout = node["timeout"].as<int>(r.timeout);
        if (node["ssh_key"]) {
            r.ssh_key_path = expand_home(node["ssh_key"].as<std::string>());
        }
    }
};

Config Config::defaults() {
    Config config;
    config.shell_.program = DEFAULT_SHELL_PROGRAM;
    config.shell_.args = {"-l", "-m"};
    config.shell_.timeout_secs = EXEC_TIMEOUT_SECS;
    config.shell_.dev_activate = DEFAULT_DEV_ACTIVATE;
    config.shell_.activation_banner = DEFAULT_ACTIVATION_BANNER;
    config.shell_.interactive_commands.assign(std::begin(DEFAULT_INTERACTIVE_COMMANDS),
                                              std::end(DEFAULT_INTERACTIVE_COMMANDS));
    config.shell_.fast_commands.assign(std::begin(DEFAULT_FAST_COMMANDS),
                                       std::end(DEFAULT_FAST_COMMANDS));
    config.remote_.timeout = SSH_CONNECT_TIMEOUT_SECS;
    return config;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".hostshell";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "hostshell.yaml";
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        Config config = defaults();
        ConfigReader::apply(config, YAML::Load(yaml_text));
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    try {
        Config config = defaults();
        ConfigReader::apply(config, YAML::LoadFile(path.string()));
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config = defaults();

    try {
        if (global_config_exists()) {
            ConfigReader::apply(config, YAML::LoadFile(get_global_config_path().string()));
        }
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }

    try {
        if (project_config_exists(project_dir)) {
            ConfigReader::apply(config, YAML::LoadFile(get_project_config_path(project_dir).string()));
        }
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
    }

    return Result<Config>::Ok(config);
}
