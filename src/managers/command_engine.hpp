#pragma once

#include <string>
#include <map>
#include <chrono>
#include <optional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <tmux/pane_port.hpp>
#include <tmux/shell_adapter.hpp>
#include "command_registry.hpp"

struct EngineOptions {
    ShellKind shell = ShellKind::Bash;
    int capture_lines = DEFAULT_CAPTURE_LINES;
    std::chrono::seconds lost_after{DEFAULT_LOST_AFTER_SECS};
};

// Dispatches commands into panes and advances their status by re-reading the
// pane on demand. Nothing here blocks on a command finishing: completion is
// only ever discovered by a later check_status().
//
// One trackable command may be in flight per pane. A second trackable
// execute on a pane whose holder is still pending is refused, since its
// START marker would be typed while the first command still owns the
// terminal. Raw-mode dispatch bypasses the hold entirely.
class CommandEngine {
public:
    CommandEngine(CommandRegistry& registry, PanePort& panes, EngineOptions options);

    // Send a command and register it as pending. Returns the new command id.
    // no_enter implies raw_mode.
    Result<std::string> execute(const std::string& pane_id, const std::string& command,
                                bool raw_mode, bool no_enter);

    // Current state of a command, re-parsing the pane if it is still pending
    // and trackable. nullopt = unknown id (never issued, or swept).
    // An error means the pane could not be captured; the entry is untouched.
    Result<std::optional<Command>> check_status(const std::string& command_id);

    // Evict entries older than max_age and drop any pane holds they owned.
    std::vector<std::string> sweep(std::chrono::minutes max_age,
                                   CommandRegistry::Clock::time_point now =
                                       CommandRegistry::Clock::now());

    // Id of the trackable command currently holding a pane, if any.
    std::optional<std::string> pane_holder(const std::string& pane_id) const;

    const EngineOptions& options() const { return options_; }

private:
    CommandRegistry& registry_;
    PanePort& panes_;
    EngineOptions options_;
    std::map<std::string, std::string> pane_holds_;   // pane id → command id

    void release_hold(const std::string& pane_id, const std::string& command_id);
    std::string allocate_id() const;
};
