#include "resource_adapter.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static const char* kCommandUriPrefix = "tmux://command/";
static const char* kCommandUriSuffix = "/result";
static const char* kPaneUriPrefix = "tmux://pane/";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string render_command(const Command& cmd) {
    if (cmd.status == CommandStatus::Pending) {
        if (cmd.tracking_lost) {
            return fmt::format(
                "Status: pending (tracking lost)\nStarted: {}\nCommand: {}\n\n--- Message ---\n"
                "Neither completion marker is visible in the pane any more. The command may "
                "have finished and scrolled out of view, or the pane may be running something "
                "else. Use capture-pane on {} to check it directly.",
                to_iso_utc(cmd.start_time), cmd.command, cmd.pane_id);
        }
        if (!cmd.result.empty()) {
            return fmt::format("Status: {}\nCommand: {}\n\n--- Message ---\n{}",
                               command_status_name(cmd.status), cmd.command, cmd.result);
        }
        return fmt::format("Command still executing...\nStarted: {}\nCommand: {}",
                           to_iso_utc(cmd.start_time), cmd.command);
    }

    std::string text = fmt::format("Status: {}\nExit code: {}\nCommand: {}\n",
                                   command_status_name(cmd.status),
                                   cmd.exit_code.value_or(-1), cmd.command);
    if (cmd.output_truncated) {
        text += "Note: output start scrolled out of the capture window; leading output may be missing\n";
    }
    text += fmt::format("\n--- Output ---\n{}", cmd.result);
    return text;
}

std::string command_resource_name(const std::string& command) {
    if (command.size() > static_cast<size_t>(COMMAND_NAME_PREVIEW_CHARS)) {
        return fmt::format("Command: {}...", command.substr(0, COMMAND_NAME_PREVIEW_CHARS));
    }
    return fmt::format("Command: {}", command);
}

json sessions_to_json(const std::vector<TmuxSession>& sessions) {
    json arr = json::array();
    for (const auto& s : sessions) {
        arr.push_back({{"id", s.id}, {"name", s.name},
                       {"attached", s.attached}, {"windows", s.windows}});
    }
    return arr;
}

json windows_to_json(const std::vector<TmuxWindow>& windows) {
    json arr = json::array();
    for (const auto& w : windows) {
        arr.push_back({{"id", w.id}, {"name", w.name},
                       {"active", w.active}, {"sessionId", w.session_id}});
    }
    return arr;
}

json panes_to_json(const std::vector<TmuxPane>& panes) {
    json arr = json::array();
    for (const auto& p : panes) {
        arr.push_back({{"id", p.id}, {"windowId", p.window_id},
                       {"active", p.active}, {"title", p.title}});
    }
    return arr;
}

// ── ResourceAdapter ──────────────────────────────────────────

ResourceAdapter::ResourceAdapter(CommandEngine& engine, CommandRegistry& registry,
                                 TmuxClient& tmux, const Config& config)
    : engine_(engine), registry_(registry), tmux_(tmux), config_(config) {}

std::vector<ResourceEntry> ResourceAdapter::static_resources() const {
    return {{SESSIONS_URI, "Tmux Sessions", "All tmux sessions as JSON"}};
}

std::vector<ResourceTemplateEntry> ResourceAdapter::templates() const {
    return {
        {PANE_URI_TEMPLATE, "Tmux Pane Content",
         "Plain-text capture of the last lines of a pane"},
        {COMMAND_RESULT_URI_TEMPLATE, "Command Execution Result",
         "Status, exit code and output of a command started with execute-command"},
    };
}

std::vector<ResourceEntry> ResourceAdapter::list() {
    auto entries = static_resources();
    for (auto& e : list_panes()) entries.push_back(std::move(e));
    for (auto& e : list_commands()) entries.push_back(std::move(e));
    return entries;
}

std::vector<ResourceEntry> ResourceAdapter::list_commands() {
    engine_.sweep(std::chrono::minutes(config_.retention_minutes()));

    std::vector<ResourceEntry> entries;
    for (const auto& id : registry_.list_active()) {
        auto cmd = registry_.get(id);
        if (!cmd) continue;
        entries.push_back({fmt::format(COMMAND_RESULT_URI, id),
                           command_resource_name(cmd->command),
                           fmt::format("Execution status: {}", command_status_name(cmd->status))});
    }
    return entries;
}

std::vector<ResourceEntry> ResourceAdapter::list_panes() {
    std::vector<ResourceEntry> entries;

    auto sessions = tmux_.list_sessions();
    if (sessions.is_err()) {
        mcp_log("resources: error listing panes: " + sessions.error);
        return entries;
    }

    for (const auto& session : sessions.value) {
        auto windows = tmux_.list_windows(session.id);
        if (windows.is_err()) {
            mcp_log("resources: error listing panes: " + windows.error);
            return {};
        }
        for (const auto& window : windows.value) {
            auto panes = tmux_.list_panes(window.id);
            if (panes.is_err()) {
                mcp_log("resources: error listing panes: " + panes.error);
                return {};
            }
            for (const auto& pane : panes.value) {
                entries.push_back({
                    fmt::format(PANE_URI, pane.id),
                    fmt::format("Pane: {} - {} - {} {}", session.name, pane.id, pane.title,
                                pane.active ? "(active)" : ""),
                    fmt::format("Content from pane {} - {} in session {}",
                                pane.id, pane.title, session.name),
                });
            }
        }
    }
    return entries;
}

Result<std::string> ResourceAdapter::read(const std::string& uri) {
    if (uri == SESSIONS_URI) {
        return Result<std::string>::Ok(read_sessions());
    }

    const std::string cmd_prefix = kCommandUriPrefix;
    const std::string cmd_suffix = kCommandUriSuffix;
    if (starts_with(uri, cmd_prefix) && ends_with(uri, cmd_suffix) &&
        uri.size() > cmd_prefix.size() + cmd_suffix.size()) {
        std::string id = uri.substr(cmd_prefix.size(),
                                    uri.size() - cmd_prefix.size() - cmd_suffix.size());
        return Result<std::string>::Ok(read_command(id));
    }

    const std::string pane_prefix = kPaneUriPrefix;
    if (starts_with(uri, pane_prefix) && uri.size() > pane_prefix.size()) {
        return Result<std::string>::Ok(read_pane(uri.substr(pane_prefix.size())));
    }

    return Result<std::string>::Err(fmt::format("Resource not found: {}", uri));
}

std::string ResourceAdapter::read_command(const std::string& command_id) {
    auto status = engine_.check_status(command_id);
    if (status.is_err()) {
        return fmt::format("Error retrieving command result: {}", status.error);
    }
    if (!status.value) {
        return fmt::format("Command not found: {}", command_id);
    }
    return render_command(*status.value);
}

std::string ResourceAdapter::read_pane(const std::string& pane_id) {
    auto content = tmux_.capture(pane_id, config_.resource_capture_lines(), false);
    if (content.is_err()) {
        return fmt::format("Error capturing pane content: {}", content.error);
    }
    return content.value.empty() ? "No content captured" : content.value;
}

std::string ResourceAdapter::read_sessions() {
    auto sessions = tmux_.list_sessions();
    if (sessions.is_err()) {
        return fmt::format("Error listing tmux sessions: {}", sessions.error);
    }
    return sessions_to_json(sessions.value).dump(2);
}
