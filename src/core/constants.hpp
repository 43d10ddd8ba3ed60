#pragma once

// ── Server identity ─────────────────────────────────────────
constexpr const char* SERVER_NAME    = "tmux-mcp";
constexpr const char* SERVER_VERSION = "0.2.2";
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";  // used when the client sends none

// ── Command tracking ────────────────────────────────────────
constexpr int DEFAULT_CAPTURE_LINES          = 1000;  // trailing window scanned for markers
constexpr int DEFAULT_RESOURCE_CAPTURE_LINES = 200;   // tmux://pane/{id} capture size
constexpr int DEFAULT_RETENTION_MINUTES      = 10;    // sweep threshold before enumeration
constexpr int DEFAULT_LOST_AFTER_SECS        = 30;    // no marker at all after this = tracking lost
constexpr int COMMAND_NAME_PREVIEW_CHARS     = 30;    // command text shown in resource names

// ── Agent launch ────────────────────────────────────────────
constexpr int DEFAULT_INITIAL_MESSAGE_DELAY_MS = 500;

// ── Resource URIs ───────────────────────────────────────────
// Use fmt::format with these: fmt::format(COMMAND_RESULT_URI, command_id)
constexpr const char* SESSIONS_URI       = "tmux://sessions";
constexpr const char* PANE_URI           = "tmux://pane/{}";
constexpr const char* COMMAND_RESULT_URI = "tmux://command/{}/result";

constexpr const char* PANE_URI_TEMPLATE           = "tmux://pane/{paneId}";
constexpr const char* COMMAND_RESULT_URI_TEMPLATE = "tmux://command/{commandId}/result";

// ── Process ─────────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE = 4096;
