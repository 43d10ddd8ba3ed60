#include "command_registry.hpp"
#include <algorithm>

const char* command_status_name(CommandStatus status) {
    switch (status) {
        case CommandStatus::Pending:   return "pending";
        case CommandStatus::Completed: return "completed";
        case CommandStatus::Error:     return "error";
    }
    return "unknown";
}

bool CommandRegistry::insert(Command cmd) {
    if (commands_.count(cmd.id)) return false;
    order_.push_back(cmd.id);
    std::string id = cmd.id;
    commands_.emplace(std::move(id), std::move(cmd));
    return true;
}

std::optional<Command> CommandRegistry::get(const std::string& id) const {
    auto it = commands_.find(id);
    if (it == commands_.end()) return std::nullopt;
    return it->second;
}

bool CommandRegistry::contains(const std::string& id) const {
    return commands_.count(id) > 0;
}

std::vector<std::string> CommandRegistry::list_active() const {
    return order_;
}

bool CommandRegistry::finish(const std::string& id, int exit_code, int success_exit_code,
                             const std::string& output, bool output_truncated) {
    auto it = commands_.find(id);
    if (it == commands_.end()) return false;
    Command& cmd = it->second;
    if (cmd.is_terminal() || cmd.raw_mode) return false;

    cmd.status = (exit_code == success_exit_code) ? CommandStatus::Completed
                                                  : CommandStatus::Error;
    cmd.exit_code = exit_code;
    cmd.result = output;
    cmd.tracking_lost = false;
    cmd.output_truncated = output_truncated;
    return true;
}

bool CommandRegistry::set_tracking_lost(const std::string& id, bool lost) {
    auto it = commands_.find(id);
    if (it == commands_.end() || it->second.is_terminal()) return false;
    it->second.tracking_lost = lost;
    return true;
}

std::vector<std::string> CommandRegistry::sweep(std::chrono::minutes max_age,
                                                Clock::time_point now) {
    std::vector<std::string> evicted;
    auto cutoff = now - max_age;

    for (const auto& id : order_) {
        auto it = commands_.find(id);
        if (it != commands_.end() && it->second.start_time < cutoff) {
            evicted.push_back(id);
            commands_.erase(it);
        }
    }

    if (!evicted.empty()) {
        order_.erase(std::remove_if(order_.begin(), order_.end(),
                                    [this](const std::string& id) {
                                        return commands_.count(id) == 0;
                                    }),
                     order_.end());
    }
    return evicted;
}
