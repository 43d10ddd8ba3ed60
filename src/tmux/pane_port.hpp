#pragma once

#include <string>
#include <core/types.hpp>

// Text-level access to a terminal pane. Errors mean the pane (or the
// multiplexer behind it) could not be reached; the message is meant to be
// shown to the caller verbatim.
class PanePort {
public:
    virtual ~PanePort() = default;

    // Trailing `lines` of the pane's scrollback, optionally with escape sequences.
    virtual Result<std::string> capture(const std::string& pane_id, int lines,
                                        bool include_colors) = 0;

    // Type `text` into the pane and submit it with Enter.
    virtual Result<void> send_text(const std::string& pane_id, const std::string& text) = 0;

    // Send keystrokes without submitting.
    virtual Result<void> send_raw_keys(const std::string& pane_id, const std::string& keys) = 0;
};
