#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include "pane_port.hpp"

// Drives the local tmux server through its CLI. Every call is one tmux
// invocation; nothing is cached between calls.
class TmuxClient : public PanePort {
public:
    explicit TmuxClient(std::string tmux_binary = "tmux");

    // ── Pane I/O (PanePort) ────────────────────────────────────

    Result<std::string> capture(const std::string& pane_id, int lines,
                                bool include_colors) override;
    Result<void> send_text(const std::string& pane_id, const std::string& text) override;
    Result<void> send_raw_keys(const std::string& pane_id, const std::string& keys) override;

    // ── Enumeration ────────────────────────────────────────────

    Result<std::vector<TmuxSession>> list_sessions();
    Result<std::optional<TmuxSession>> find_session(const std::string& name);
    Result<std::vector<TmuxWindow>> list_windows(const std::string& session_id);
    Result<std::vector<TmuxPane>> list_panes(const std::string& window_id);

    // Resolve the active pane of a target (session[:window[.pane]]);
    // empty target means the current client's active pane.
    Result<std::string> active_pane_id(const std::string& target = "");

    // ── Management ─────────────────────────────────────────────

    Result<std::optional<TmuxSession>> create_session(const std::string& name);
    Result<std::optional<TmuxWindow>> create_window(const std::string& session_id,
                                                    const std::string& name);
    Result<void> kill_session(const std::string& session_id);
    Result<void> kill_window(const std::string& window_id);
    Result<void> kill_pane(const std::string& pane_id);

    // direction: "horizontal" (side by side) or "vertical" (top/bottom).
    // size: percentage of the new pane, 1..99, or nullopt for tmux's default.
    Result<std::optional<TmuxPane>> split_pane(const std::string& pane_id,
                                               const std::string& direction,
                                               std::optional<int> size);
    Result<void> select_pane(const std::string& pane_id);
    Result<void> rename_pane(const std::string& pane_id, const std::string& title);

    // Key names tmux understands as-is (Up, Escape, F5, C-c, ...).
    static bool is_special_key(const std::string& keys);

private:
    std::string tmux_;

    Result<std::string> run(const std::vector<std::string>& args);
};

// Parsers for the -F formats used above, exposed for tests.
std::vector<TmuxSession> parse_session_lines(const std::string& out);
std::vector<TmuxWindow> parse_window_lines(const std::string& out, const std::string& session_id);
std::vector<TmuxPane> parse_pane_lines(const std::string& out, const std::string& window_id);
