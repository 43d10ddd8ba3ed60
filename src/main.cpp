#include <iostream>
#include <string>
#include <optional>
#include <fmt/format.h>
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "mcp/server.hpp"

void print_usage() {
    fmt::print(R"(
{0} v{1}
MCP Server for interfacing with tmux sessions

USAGE:
  {0} [OPTIONS]

OPTIONS:
  -s, --shell-type <TYPE>  Shell type to use for command execution
                           Options: bash, zsh, fish
                           Default: bash (or shell_type in the config file)

  -c, --config <PATH>      Configuration file
                           Default: ~/.tmux-mcp/config.yaml

  -h, --help               Show this help message and exit
      --version            Show version and exit

DESCRIPTION:
  A Model Context Protocol server that enables AI assistants to interact
  with tmux sessions. Provides tools and resources for reading terminal
  content, executing commands, and managing tmux sessions/windows/panes.

EXAMPLES:
  {0}                      # Start with default bash shell
  {0} --shell-type=zsh     # Start with zsh shell type
  {0} -s fish              # Start with fish shell type
)", SERVER_NAME, SERVER_VERSION);
}

struct CliOptions {
    std::optional<std::string> shell_type;
    std::optional<std::string> config_path;
    bool help = false;
    bool version = false;
};

// Accepts "-s fish", "--shell-type fish" and "--shell-type=fish".
static bool parse_args(int argc, char** argv, CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        bool inline_value = false;

        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            inline_value = true;
        }

        auto take_value = [&](std::optional<std::string>& out) {
            if (inline_value) {
                out = value;
                return true;
            }
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-s" || arg == "--shell-type") {
            if (!take_value(opts.shell_type)) return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!take_value(opts.config_path)) return false;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv) {
    CliOptions opts;
    std::string error;
    if (!parse_args(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        print_usage();
        return 1;
    }

    if (opts.help) {
        print_usage();
        return 0;
    }
    if (opts.version) {
        fmt::print("{} version {}\n", SERVER_NAME, SERVER_VERSION);
        return 0;
    }

    auto load_result = opts.config_path ? Config::load_file(*opts.config_path)
                                        : Config::load_global();
    if (load_result.is_err()) {
        std::cerr << "Failed to start MCP server: " << load_result.error << "\n";
        return 1;
    }
    Config config = load_result.value;

    if (opts.shell_type) {
        auto set = config.set_shell(*opts.shell_type);
        if (set.is_err()) {
            std::cerr << "Failed to start MCP server: " << set.error << "\n";
            return 1;
        }
    }

    set_mcp_log_path(config.log_file());

    try {
        McpServer server(config);
        std::ios::sync_with_stdio(false);
        server.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        mcp_log(std::string("fatal: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
