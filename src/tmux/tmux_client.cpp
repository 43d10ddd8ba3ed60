#include "tmux_client.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <sstream>

static constexpr const char* kSessionFormat =
    "#{session_id}\t#{?session_attached,1,0}\t#{session_windows}\t#{session_name}";
static constexpr const char* kWindowFormat =
    "#{window_id}\t#{?window_active,1,0}\t#{window_name}";
static constexpr const char* kPaneFormat =
    "#{pane_id}\t#{?pane_active,1,0}\t#{pane_title}";

// Split on '\t' into at most `max_fields`; the last field keeps any remaining tabs.
static std::vector<std::string> split_fields(const std::string& line, size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        auto tab = line.find('\t', start);
        if (tab == std::string::npos) break;
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

static std::vector<std::string> split_lines(const std::string& out) {
    std::vector<std::string> lines;
    std::istringstream ss(out);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<TmuxSession> parse_session_lines(const std::string& out) {
    std::vector<TmuxSession> sessions;
    for (const auto& line : split_lines(out)) {
        auto f = split_fields(line, 4);
        if (f.size() < 4) continue;
        TmuxSession s;
        s.id = f[0];
        s.attached = (f[1] == "1");
        s.windows = safe_stoi(f[2], 0);
        s.name = f[3];
        sessions.push_back(s);
    }
    return sessions;
}

std::vector<TmuxWindow> parse_window_lines(const std::string& out, const std::string& session_id) {
    std::vector<TmuxWindow> windows;
    for (const auto& line : split_lines(out)) {
        auto f = split_fields(line, 3);
        if (f.size() < 3) continue;
        TmuxWindow w;
        w.id = f[0];
        w.active = (f[1] == "1");
        w.name = f[2];
        w.session_id = session_id;
        windows.push_back(w);
    }
    return windows;
}

std::vector<TmuxPane> parse_pane_lines(const std::string& out, const std::string& window_id) {
    std::vector<TmuxPane> panes;
    for (const auto& line : split_lines(out)) {
        auto f = split_fields(line, 3);
        if (f.size() < 3) continue;
        TmuxPane p;
        p.id = f[0];
        p.active = (f[1] == "1");
        p.title = f[2];
        p.window_id = window_id;
        panes.push_back(p);
    }
    return panes;
}

// ── TmuxClient ───────────────────────────────────────────────

TmuxClient::TmuxClient(std::string tmux_binary) : tmux_(std::move(tmux_binary)) {}

Result<std::string> TmuxClient::run(const std::vector<std::string>& args) {
    ProcessResult r = platform::run_process(tmux_, args);
    if (r.success()) {
        return Result<std::string>::Ok(r.stdout_data);
    }

    std::string cmd = platform::describe_command(tmux_, args);
    mcp_log_process("tmux", cmd, r);

    std::string reason = r.stderr_data;
    trim(reason);
    if (r.exit_code == 127 && reason.empty()) {
        reason = fmt::format("could not execute '{}'", tmux_);
    } else if (reason.empty()) {
        reason = fmt::format("exit code {}", r.exit_code);
    }
    return Result<std::string>::Err(fmt::format("{} failed: {}", cmd, reason));
}

Result<std::string> TmuxClient::capture(const std::string& pane_id, int lines,
                                        bool include_colors) {
    std::vector<std::string> args = {"capture-pane", "-p", "-J", "-t", pane_id,
                                     "-S", fmt::format("-{}", std::max(lines, 1)),
                                     "-E", "-"};
    if (include_colors) args.push_back("-e");

    auto r = run(args);
    if (r.is_err()) return r;

    std::string text = std::move(r.value);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'
                          || text.back() == ' '))
        text.pop_back();
    return Result<std::string>::Ok(text);
}

Result<void> TmuxClient::send_text(const std::string& pane_id, const std::string& text) {
    std::string body = text;
    if (!body.empty() && body.back() == '\n') body.pop_back();

    if (!body.empty()) {
        auto r = run({"send-keys", "-t", pane_id, "-l", body});
        if (r.is_err()) return Result<void>::Err(r.error);
    }
    auto enter = run({"send-keys", "-t", pane_id, "Enter"});
    if (enter.is_err()) return Result<void>::Err(enter.error);
    return Result<void>::Ok();
}

bool TmuxClient::is_special_key(const std::string& keys) {
    static const std::set<std::string> kNamed = {
        "Up", "Down", "Left", "Right", "Escape", "Tab", "BTab", "Enter", "Space",
        "BSpace", "Delete", "Home", "End", "PageUp", "PageDown", "PPage", "NPage",
        "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
    };
    if (kNamed.count(keys)) return true;
    // Chords like C-c, M-x, C-M-a
    if (keys.size() >= 3 && keys[keys.size() - 2] == '-') {
        std::string mods = keys.substr(0, keys.size() - 2);
        for (size_t i = 0; i < mods.size(); i += 2) {
            if (mods[i] != 'C' && mods[i] != 'M' && mods[i] != 'S') return false;
            if (i + 1 < mods.size() && mods[i + 1] != '-') return false;
        }
        return mods.size() % 2 == 1;
    }
    return false;
}

Result<void> TmuxClient::send_raw_keys(const std::string& pane_id, const std::string& keys) {
    if (is_special_key(keys)) {
        auto r = run({"send-keys", "-t", pane_id, keys});
        if (r.is_err()) return Result<void>::Err(r.error);
        return Result<void>::Ok();
    }

    // One keystroke per UTF-8 sequence so TUIs filtering input see each char
    size_t i = 0;
    while (i < keys.size()) {
        unsigned char c = static_cast<unsigned char>(keys[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        len = std::min(len, keys.size() - i);

        auto r = run({"send-keys", "-t", pane_id, "-l", keys.substr(i, len)});
        if (r.is_err()) return Result<void>::Err(r.error);
        i += len;
    }
    return Result<void>::Ok();
}

Result<std::vector<TmuxSession>> TmuxClient::list_sessions() {
    auto r = run({"list-sessions", "-F", kSessionFormat});
    if (r.is_err()) {
        // No server running means no sessions, not a failure
        if (r.error.find("no server running") != std::string::npos ||
            r.error.find("error connecting to") != std::string::npos) {
            return Result<std::vector<TmuxSession>>::Ok({});
        }
        return Result<std::vector<TmuxSession>>::Err(r.error);
    }
    return Result<std::vector<TmuxSession>>::Ok(parse_session_lines(r.value));
}

Result<std::optional<TmuxSession>> TmuxClient::find_session(const std::string& name) {
    auto sessions = list_sessions();
    if (sessions.is_err()) return Result<std::optional<TmuxSession>>::Err(sessions.error);
    for (const auto& s : sessions.value) {
        if (s.name == name) return Result<std::optional<TmuxSession>>::Ok(s);
    }
    return Result<std::optional<TmuxSession>>::Ok(std::nullopt);
}

Result<std::vector<TmuxWindow>> TmuxClient::list_windows(const std::string& session_id) {
    auto r = run({"list-windows", "-t", session_id, "-F", kWindowFormat});
    if (r.is_err()) return Result<std::vector<TmuxWindow>>::Err(r.error);
    return Result<std::vector<TmuxWindow>>::Ok(parse_window_lines(r.value, session_id));
}

Result<std::vector<TmuxPane>> TmuxClient::list_panes(const std::string& window_id) {
    auto r = run({"list-panes", "-t", window_id, "-F", kPaneFormat});
    if (r.is_err()) return Result<std::vector<TmuxPane>>::Err(r.error);
    return Result<std::vector<TmuxPane>>::Ok(parse_pane_lines(r.value, window_id));
}

Result<std::string> TmuxClient::active_pane_id(const std::string& target) {
    std::vector<std::string> args = {"display-message", "-p"};
    if (!target.empty()) {
        args.push_back("-t");
        args.push_back(target);
    }
    args.push_back("#{pane_id}");

    auto r = run(args);
    if (r.is_err()) return r;
    std::string id = r.value;
    trim(id);
    if (id.empty()) {
        return Result<std::string>::Err(
            fmt::format("No active pane for target '{}'", target));
    }
    return Result<std::string>::Ok(id);
}

Result<std::optional<TmuxSession>> TmuxClient::create_session(const std::string& name) {
    auto r = run({"new-session", "-d", "-s", name, "-P", "-F", kSessionFormat});
    if (r.is_err()) return Result<std::optional<TmuxSession>>::Err(r.error);
    auto sessions = parse_session_lines(r.value);
    if (sessions.empty()) return find_session(name);
    return Result<std::optional<TmuxSession>>::Ok(sessions.front());
}

Result<std::optional<TmuxWindow>> TmuxClient::create_window(const std::string& session_id,
                                                            const std::string& name) {
    auto r = run({"new-window", "-t", session_id, "-n", name, "-P", "-F", kWindowFormat});
    if (r.is_err()) return Result<std::optional<TmuxWindow>>::Err(r.error);
    auto windows = parse_window_lines(r.value, session_id);
    if (windows.empty()) return Result<std::optional<TmuxWindow>>::Ok(std::nullopt);
    return Result<std::optional<TmuxWindow>>::Ok(windows.front());
}

Result<void> TmuxClient::kill_session(const std::string& session_id) {
    auto r = run({"kill-session", "-t", session_id});
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> TmuxClient::kill_window(const std::string& window_id) {
    auto r = run({"kill-window", "-t", window_id});
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> TmuxClient::kill_pane(const std::string& pane_id) {
    auto r = run({"kill-pane", "-t", pane_id});
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<std::optional<TmuxPane>> TmuxClient::split_pane(const std::string& pane_id,
                                                       const std::string& direction,
                                                       std::optional<int> size) {
    if (direction != "horizontal" && direction != "vertical") {
        return Result<std::optional<TmuxPane>>::Err(
            fmt::format("Invalid split direction '{}' (expected horizontal or vertical)", direction));
    }
    if (size && (*size < 1 || *size > 99)) {
        return Result<std::optional<TmuxPane>>::Err(
            fmt::format("Invalid pane size {} (expected 1-99)", *size));
    }

    // tmux -h splits side by side, -v top/bottom
    std::vector<std::string> args = {"split-window",
                                     direction == "horizontal" ? "-h" : "-v"};
    if (size) {
        args.push_back("-l");
        args.push_back(fmt::format("{}%", *size));
    }
    args.insert(args.end(), {"-t", pane_id, "-P", "-F",
                             std::string("#{window_id}\t") + kPaneFormat});

    auto r = run(args);
    if (r.is_err()) return Result<std::optional<TmuxPane>>::Err(r.error);

    for (const auto& line : split_lines(r.value)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        auto panes = parse_pane_lines(line.substr(tab + 1), line.substr(0, tab));
        if (!panes.empty()) return Result<std::optional<TmuxPane>>::Ok(panes.front());
    }
    return Result<std::optional<TmuxPane>>::Ok(std::nullopt);
}

Result<void> TmuxClient::select_pane(const std::string& pane_id) {
    auto r = run({"select-pane", "-t", pane_id});
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> TmuxClient::rename_pane(const std::string& pane_id, const std::string& title) {
    auto r = run({"select-pane", "-t", pane_id, "-T", title});
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}
