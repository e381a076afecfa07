#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Built-in defaults only (no files read)
    static Config defaults();

    // Defaults, then global, then project overrides. Missing files are skipped.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a single YAML file on top of the built-in defaults
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text on top of the built-in defaults
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ShellConfig& shell() const { return shell_; }
    const Environment& environment() const { return environment_; }
    const RemoteConfig& remote() const { return remote_; }
    const LoggingConfig& logging() const { return logging_; }

    Config() = default;

private:
    ShellConfig shell_;
    Environment environment_;
    RemoteConfig remote_;
    LoggingConfig logging_;

    friend class ConfigReader;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
