#include "command_engine.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <tmux/marker_protocol.hpp>
#include <fmt/format.h>

static const char* kRawModeMessage =
    "Interactive command sent in raw mode. Status tracking is disabled; "
    "use capture-pane to verify the command outcome.";
static const char* kNoEnterMessage =
    "Keys sent without Enter. Status tracking is disabled; "
    "use capture-pane to see the result.";

CommandEngine::CommandEngine(CommandRegistry& registry, PanePort& panes, EngineOptions options)
    : registry_(registry), panes_(panes), options_(options) {}

std::string CommandEngine::allocate_id() const {
    std::string id = generate_uuid();
    while (registry_.contains(id)) id = generate_uuid();
    return id;
}

Result<std::string> CommandEngine::execute(const std::string& pane_id,
                                           const std::string& command,
                                           bool raw_mode, bool no_enter) {
    if (no_enter) raw_mode = true;

    if (!raw_mode && command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<std::string>::Err("Command text is empty");
    }

    if (!raw_mode) {
        auto held = pane_holds_.find(pane_id);
        if (held != pane_holds_.end()) {
            std::string holder = held->second;
            auto status = check_status(holder);
            if (status.is_err()) return Result<std::string>::Err(status.error);
            if (!status.value) release_hold(pane_id, holder);

            auto still = pane_holder(pane_id);
            if (still && *still == holder) {
                return Result<std::string>::Err(fmt::format(
                    "Pane {} is busy with command {}. Wait for it to finish "
                    "(get-command-result) or use rawMode.", pane_id, holder));
            }
        }
    }

    Command cmd;
    cmd.id = allocate_id();
    cmd.pane_id = pane_id;
    cmd.command = command;
    cmd.raw_mode = raw_mode;

    Result<void> sent = Result<void>::Ok();
    if (no_enter) {
        sent = panes_.send_raw_keys(pane_id, command);
        cmd.result = kNoEnterMessage;
    } else if (raw_mode) {
        sent = panes_.send_text(pane_id, command);
        cmd.result = kRawModeMessage;
    } else {
        sent = panes_.send_text(pane_id,
                                build_wrapped_command(cmd.id, command, options_.shell));
    }

    if (sent.is_err()) {
        mcp_log(fmt::format("execute: send to {} failed: {}", pane_id, sent.error));
        return Result<std::string>::Err(sent.error);
    }

    cmd.start_time = CommandRegistry::Clock::now();
    std::string id = cmd.id;
    registry_.insert(std::move(cmd));
    if (!raw_mode) pane_holds_[pane_id] = id;

    mcp_log(fmt::format("execute: {} on {} ({})", id, pane_id,
                        no_enter ? "keys" : raw_mode ? "raw" : "tracked"));
    return Result<std::string>::Ok(id);
}

Result<std::optional<Command>> CommandEngine::check_status(const std::string& command_id) {
    using R = Result<std::optional<Command>>;

    auto cmd = registry_.get(command_id);
    if (!cmd) return R::Ok(std::nullopt);
    if (cmd->is_terminal() || cmd->raw_mode) return R::Ok(cmd);

    auto captured = panes_.capture(cmd->pane_id, options_.capture_lines, false);
    if (captured.is_err()) {
        return R::Err(fmt::format("Failed to check command {}: {}", command_id, captured.error));
    }

    MarkerResult parsed = parse_marker_output(captured.value, command_id);
    switch (parsed.state) {
        case MarkerState::Complete: {
            int success = shell_traits(options_.shell).success_exit_code;
            registry_.finish(command_id, parsed.exit_code, success, parsed.output,
                             !parsed.start_seen);
            release_hold(cmd->pane_id, command_id);
            mcp_log(fmt::format("status: {} finished exit={}", command_id, parsed.exit_code));
            break;
        }
        case MarkerState::Running:
            if (cmd->tracking_lost) {
                registry_.set_tracking_lost(command_id, false);
                // Back in view and still running: it owns the pane again.
                if (!pane_holds_.count(cmd->pane_id)) pane_holds_[cmd->pane_id] = command_id;
            }
            break;
        case MarkerState::Missing: {
            auto age = CommandRegistry::Clock::now() - cmd->start_time;
            if (!cmd->tracking_lost && age >= options_.lost_after) {
                registry_.set_tracking_lost(command_id, true);
                release_hold(cmd->pane_id, command_id);
                mcp_log(fmt::format("status: {} lost (no markers in last {} lines of {})",
                                    command_id, options_.capture_lines, cmd->pane_id));
            }
            break;
        }
    }

    return R::Ok(registry_.get(command_id));
}

std::vector<std::string> CommandEngine::sweep(std::chrono::minutes max_age,
                                             CommandRegistry::Clock::time_point now) {
    auto evicted = registry_.sweep(max_age, now);
    if (evicted.empty()) return evicted;

    for (auto it = pane_holds_.begin(); it != pane_holds_.end();) {
        if (!registry_.contains(it->second)) it = pane_holds_.erase(it);
        else ++it;
    }
    mcp_log(fmt::format("sweep: evicted {} command(s)", evicted.size()));
    return evicted;
}

std::optional<std::string> CommandEngine::pane_holder(const std::string& pane_id) const {
    auto it = pane_holds_.find(pane_id);
    if (it == pane_holds_.end()) return std::nullopt;
    return it->second;
}

void CommandEngine::release_hold(const std::string& pane_id, const std::string& command_id) {
    auto it = pane_holds_.find(pane_id);
    if (it != pane_holds_.end() && it->second == command_id) pane_holds_.erase(it);
}
