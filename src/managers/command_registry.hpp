#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>

enum class CommandStatus {
    Pending,
    Completed,
    Error,
};

const char* command_status_name(CommandStatus status);

struct Command {
    std::string id;
    std::string pane_id;
    std::string command;                         // caller's text, never the wrapped form
    std::chrono::system_clock::time_point start_time;
    CommandStatus status = CommandStatus::Pending;
    std::optional<int> exit_code;                // set iff status != Pending
    std::string result;                          // output, or an advisory message while pending
    bool raw_mode = false;                       // no markers, never leaves Pending
    bool tracking_lost = false;                  // markers gone from the capture window
    bool output_truncated = false;               // START marker had scrolled out when END was seen

    bool is_terminal() const { return status != CommandStatus::Pending; }
};

// In-memory store of dispatched commands, keyed by id, in dispatch order.
// Owned by the server and handed to the engine and the resource layer.
class CommandRegistry {
public:
    using Clock = std::chrono::system_clock;

    // False if the id is already present.
    bool insert(Command cmd);

    std::optional<Command> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    size_t size() const { return commands_.size(); }

    // Ids currently held, in insertion order.
    std::vector<std::string> list_active() const;

    // Pending → Completed/Error. Ignored (returns false) if the command is
    // unknown or already terminal.
    bool finish(const std::string& id, int exit_code, int success_exit_code,
                const std::string& output, bool output_truncated);

    // Flag or clear tracking loss on a pending command.
    bool set_tracking_lost(const std::string& id, bool lost);

    // Drop every entry started more than `max_age` before `now`, whatever its
    // status. Returns the evicted ids.
    std::vector<std::string> sweep(std::chrono::minutes max_age,
                                   Clock::time_point now = Clock::now());

private:
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;
};
