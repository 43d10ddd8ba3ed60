#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <managers/command_engine.hpp>
#include <tmux/tmux_client.hpp>
#include "json.hpp"

struct ResourceEntry {
    std::string uri;
    std::string name;
    std::string description;
};

struct ResourceTemplateEntry {
    std::string uri_template;
    std::string name;
    std::string description;
};

// Human-readable rendering of a command record, shared by the
// get-command-result tool and tmux://command/{id}/result.
std::string render_command(const Command& cmd);

// Short listing name: "Command: <first 30 chars>..."
std::string command_resource_name(const std::string& command);

// Read model over the command registry and the tmux server.
//
//   tmux://sessions                     static, JSON session list
//   tmux://pane/{paneId}                plain capture of the pane
//   tmux://command/{commandId}/result   live status check on every read
class ResourceAdapter {
public:
    ResourceAdapter(CommandEngine& engine, CommandRegistry& registry,
                    TmuxClient& tmux, const Config& config);

    std::vector<ResourceEntry> static_resources() const;
    std::vector<ResourceTemplateEntry> templates() const;

    // Static resources plus every enumerable pane and command.
    std::vector<ResourceEntry> list();

    // Sweeps stale commands first.
    std::vector<ResourceEntry> list_commands();

    // Walks sessions → windows → panes; failures yield an empty list.
    std::vector<ResourceEntry> list_panes();

    // Text for a URI. Err only for URIs that match no resource at all;
    // lookup failures are rendered into the text.
    Result<std::string> read(const std::string& uri);

    std::string read_command(const std::string& command_id);
    std::string read_pane(const std::string& pane_id);
    std::string read_sessions();

private:
    CommandEngine& engine_;
    CommandRegistry& registry_;
    TmuxClient& tmux_;
    const Config& config_;
};

json sessions_to_json(const std::vector<TmuxSession>& sessions);
json windows_to_json(const std::vector<TmuxWindow>& windows);
json panes_to_json(const std::vector<TmuxPane>& panes);
