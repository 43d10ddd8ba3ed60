#include "shell_adapter.hpp"
#include <fmt/format.h>

static const ShellTraits kBashTraits{"bash", "$?", "; ", 0};
static const ShellTraits kZshTraits{"zsh", "$?", "; ", 0};
static const ShellTraits kFishTraits{"fish", "$status", "; ", 0};

const ShellTraits& shell_traits(ShellKind kind) {
    switch (kind) {
        case ShellKind::Bash: return kBashTraits;
        case ShellKind::Zsh:  return kZshTraits;
        case ShellKind::Fish: return kFishTraits;
    }
    return kBashTraits;
}

Result<ShellKind> parse_shell_kind(const std::string& name) {
    if (name == "bash") return Result<ShellKind>::Ok(ShellKind::Bash);
    if (name == "zsh")  return Result<ShellKind>::Ok(ShellKind::Zsh);
    if (name == "fish") return Result<ShellKind>::Ok(ShellKind::Fish);
    return Result<ShellKind>::Err(
        fmt::format("Unsupported shell type '{}' (expected bash, zsh or fish)", name));
}
