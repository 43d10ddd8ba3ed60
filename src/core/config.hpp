#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include <tmux/shell_adapter.hpp>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.tmux-mcp/config.yaml (defaults if the file is absent)
    static Result<Config> load_global();

    // Load a specific file; a missing file is an error here
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly
    static Result<Config> from_yaml(const std::string& text);

    // Built-in defaults only
    static Config defaults();

    // Accessors
    ShellKind shell() const { return shell_; }
    const std::string& tmux_binary() const { return tmux_binary_; }
    const std::string& git_binary() const { return git_binary_; }
    int capture_lines() const { return capture_lines_; }
    int resource_capture_lines() const { return resource_capture_lines_; }
    int retention_minutes() const { return retention_minutes_; }
    int lost_after_seconds() const { return lost_after_seconds_; }
    int initial_message_delay_ms() const { return initial_message_delay_ms_; }
    const std::string& log_file() const { return log_file_; }
    const std::map<std::string, std::string>& agents() const { return agents_; }

    // Command for an agent preset, if configured
    std::optional<std::string> agent_command(const std::string& preset) const;

    // Command-line overrides
    Result<void> set_shell(const std::string& name);

private:
    ShellKind shell_ = ShellKind::Bash;
    std::string tmux_binary_ = "tmux";
    std::string git_binary_ = "git";
    int capture_lines_ = DEFAULT_CAPTURE_LINES;
    int resource_capture_lines_ = DEFAULT_RESOURCE_CAPTURE_LINES;
    int retention_minutes_ = DEFAULT_RETENTION_MINUTES;
    int lost_after_seconds_ = DEFAULT_LOST_AFTER_SECS;
    int initial_message_delay_ms_ = DEFAULT_INITIAL_MESSAGE_DELAY_MS;
    std::string log_file_;
    std::map<std::string, std::string> agents_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
