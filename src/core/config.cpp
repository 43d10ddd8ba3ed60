#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".tmux-mcp";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Config Config::defaults() {
    Config c;
    c.agents_ = {
        {"codex", "codex"},
        {"claudecode", "claudecode"},
        {"gemini", "gemini"},
    };
    return c;
}

// Positive integer key, or the current value when absent.
static Result<int> read_positive(const YAML::Node& root, const char* key, int current,
                                 bool allow_zero = false) {
    if (!root[key]) return Result<int>::Ok(current);
    int v = 0;
    try {
        v = root[key].as<int>();
    } catch (const YAML::Exception&) {
        return Result<int>::Err(fmt::format("config: '{}' must be an integer", key));
    }
    if (v < 0 || (v == 0 && !allow_zero)) {
        return Result<int>::Err(fmt::format("config: '{}' must be positive (got {})", key, v));
    }
    return Result<int>::Ok(v);
}

Result<Config> Config::from_yaml(const std::string& text) {
    Config c = defaults();

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("config: invalid YAML: {}", e.what()));
    }
    if (root.IsNull()) return Result<Config>::Ok(c);
    if (!root.IsMap()) return Result<Config>::Err("config: top level must be a mapping");

    if (root["shell_type"]) {
        auto set = c.set_shell(root["shell_type"].as<std::string>(""));
        if (set.is_err()) return Result<Config>::Err(set.error);
    }

    c.tmux_binary_ = root["tmux_binary"].as<std::string>(c.tmux_binary_);
    c.git_binary_ = root["git_binary"].as<std::string>(c.git_binary_);
    c.log_file_ = root["log_file"].as<std::string>("");

    struct IntKey { const char* key; int* field; bool allow_zero; };
    IntKey ints[] = {
        {"capture_lines", &c.capture_lines_, false},
        {"resource_capture_lines", &c.resource_capture_lines_, false},
        {"retention_minutes", &c.retention_minutes_, false},
        {"lost_after_seconds", &c.lost_after_seconds_, true},
        {"initial_message_delay_ms", &c.initial_message_delay_ms_, true},
    };
    for (const auto& k : ints) {
        auto v = read_positive(root, k.key, *k.field, k.allow_zero);
        if (v.is_err()) return Result<Config>::Err(v.error);
        *k.field = v.value;
    }

    if (root["agents"]) {
        if (!root["agents"].IsMap()) {
            return Result<Config>::Err("config: 'agents' must be a mapping of name to command");
        }
        for (const auto& kv : root["agents"]) {
            c.agents_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    return Result<Config>::Ok(c);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("config: file not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) return Result<Config>::Err("config: cannot open " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();

    auto loaded = from_yaml(ss.str());
    if (loaded.is_err()) {
        return Result<Config>::Err(fmt::format("{} ({})", loaded.error, path.string()));
    }
    return loaded;
}

Result<Config> Config::load_global() {
    fs::path path = get_global_config_path();
    if (!fs::exists(path)) return Result<Config>::Ok(defaults());
    return load_file(path);
}

std::optional<std::string> Config::agent_command(const std::string& preset) const {
    auto it = agents_.find(preset);
    if (it == agents_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

Result<void> Config::set_shell(const std::string& name) {
    auto kind = parse_shell_kind(name);
    if (kind.is_err()) return Result<void>::Err(kind.error);
    shell_ = kind.value;
    return Result<void>::Ok();
}
