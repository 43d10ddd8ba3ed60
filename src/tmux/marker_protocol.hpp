#pragma once

#include <string>
#include "shell_adapter.hpp"

// Marker protocol for START/END command wrapping inside an interactive pane.
//
// A trackable command is sent as
//   echo "<<STA""RT:{id}>>"; {command}; echo "<<EN""D:{id}:$?>>"
// The quote split keeps the literal marker out of the pane's echo of the
// typed line, so only the shell's own output ever contains a full marker.
// Markers carry the command id and are closed by ">>", so the id "c1" never
// matches inside the markers of "c10".

enum class MarkerState {
    Complete,   // END marker seen, exit code parsed
    Running,    // START seen, END not yet
    Missing,    // neither marker in the captured window
};

struct MarkerResult {
    MarkerState state = MarkerState::Missing;
    std::string output;
    int exit_code = 0;
    bool start_seen = false;   // false on Complete means output starts at the capture window

    bool found() const { return state == MarkerState::Complete; }
};

std::string start_marker(const std::string& command_id);
std::string end_marker(const std::string& command_id, int exit_code);

// Build the text to type into the pane. Always ends with '\n'.
// Single-line commands keep the END echo on the same line; multi-line
// commands (heredocs) put it on its own line so terminators aren't mangled.
std::string build_wrapped_command(const std::string& command_id,
                                  const std::string& command,
                                  ShellKind shell);

// Locate this command's markers in captured pane text.
MarkerResult parse_marker_output(const std::string& captured,
                                 const std::string& command_id);
