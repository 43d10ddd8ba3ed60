#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

static const char* kStartTag = "<<START:";
static const char* kEndTag   = "<<END:";
static const char* kClose    = ">>";

std::string start_marker(const std::string& command_id) {
    return fmt::format("{}{}{}", kStartTag, command_id, kClose);
}

std::string end_marker(const std::string& command_id, int exit_code) {
    return fmt::format("{}{}:{}{}", kEndTag, command_id, exit_code, kClose);
}

std::string build_wrapped_command(const std::string& command_id,
                                  const std::string& command,
                                  ShellKind shell) {
    const ShellTraits& traits = shell_traits(shell);

    // "<<STA""RT:" concatenates to "<<START:" in bash, zsh and fish alike.
    std::string begin = fmt::format("echo \"<<STA\"\"RT:{}>>\"", command_id);
    std::string done = fmt::format("echo \"<<EN\"\"D:{}:{}>>\"",
                                   command_id, traits.exit_status_var);

    if (command.find('\n') == std::string::npos) {
        return begin + traits.separator + command + traits.separator + done + "\n";
    }
    return begin + traits.separator + command + "\n" + done + "\n";
}

// Find "<<END:{id}:<digits>>>" at or after `from`. Returns npos if absent.
static size_t find_end_marker(const std::string& text, const std::string& command_id,
                              size_t from, int& exit_code, size_t& marker_len) {
    const std::string prefix = std::string(kEndTag) + command_id + ":";
    size_t pos = text.find(prefix, from);
    while (pos != std::string::npos) {
        size_t p = pos + prefix.size();
        size_t digits_start = p;
        if (p < text.size() && text[p] == '-') p++;
        size_t num_start = p;
        while (p < text.size() && std::isdigit(static_cast<unsigned char>(text[p]))) p++;
        if (p > num_start && text.compare(p, 2, kClose) == 0) {
            exit_code = safe_stoi(text.substr(digits_start, p - digits_start), 0);
            marker_len = p + 2 - pos;
            return pos;
        }
        pos = text.find(prefix, pos + 1);
    }
    return std::string::npos;
}

MarkerResult parse_marker_output(const std::string& captured,
                                 const std::string& command_id) {
    MarkerResult result;
    const std::string begin = start_marker(command_id);

    auto begin_pos = captured.rfind(begin);
    result.start_seen = (begin_pos != std::string::npos);
    size_t search_from = result.start_seen ? begin_pos + begin.size() : 0;

    int exit_code = 0;
    size_t marker_len = 0;
    auto done_pos = find_end_marker(captured, command_id, search_from, exit_code, marker_len);

    if (done_pos == std::string::npos) {
        result.state = result.start_seen ? MarkerState::Running : MarkerState::Missing;
        return result;
    }

    std::string clean = captured.substr(search_from, done_pos - search_from);
    trim(clean);

    // Multi-line commands: the shell prompts for the END echo line after the
    // body ran, so its echo sits just above the END marker.
    const std::string typed_end = fmt::format("<<EN\"\"D:{}:", command_id);
    auto last_nl = clean.rfind('\n');
    if (last_nl != std::string::npos) {
        if (clean.find(typed_end, last_nl + 1) != std::string::npos) {
            clean.erase(last_nl);
            trim(clean);
        }
    } else if (clean.find(typed_end) != std::string::npos) {
        clean.clear();
    }

    result.state = MarkerState::Complete;
    result.output = clean;
    result.exit_code = exit_code;
    return result;
}
