#pragma once

#include <string>
#include <core/types.hpp>

// Shells whose statement syntax the command wrapper knows how to target.
enum class ShellKind {
    Bash,
    Zsh,
    Fish,
};

// Per-shell conventions used to wrap a command and read back its exit status.
struct ShellTraits {
    const char* name;
    const char* exit_status_var;   // expands to the previous command's exit status
    const char* separator;         // statement separator
    int success_exit_code;
};

// Lookup table entry for a shell. Total over ShellKind.
const ShellTraits& shell_traits(ShellKind kind);

// Parse "bash" / "zsh" / "fish". Anything else is a configuration error.
Result<ShellKind> parse_shell_kind(const std::string& name);

inline const char* shell_name(ShellKind kind) { return shell_traits(kind).name; }
