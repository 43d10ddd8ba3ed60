#include "process.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <poll.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        return ProcessResult{-1, "", std::string("pipe failed: ") + std::strerror(errno)};
    }
    if (pipe(err_pipe) != 0) {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return ProcessResult{-1, "", std::string("pipe failed: ") + std::strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return ProcessResult{-1, "", std::string("fork failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    ProcessResult result{0, "", ""};
    char buf[PIPE_READ_BUF_SIZE];
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};

    // Drain both pipes together so a chatty stderr can't block stdout
    while (fds[0] >= 0 || fds[1] >= 0) {
        struct pollfd pfds[2];
        int n = 0;
        int map[2];
        for (int i = 0; i < 2; i++) {
            if (fds[i] < 0) continue;
            pfds[n].fd = fds[i];
            pfds[n].events = POLLIN;
            pfds[n].revents = 0;
            map[n] = i;
            n++;
        }
        if (poll(pfds, n, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int k = 0; k < n; k++) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = map[k];
            ssize_t r = read(fds[i], buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                close_fd(fds[i]);
            }
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        if (a.empty() || a.find_first_of(" \t\n'\"") != std::string::npos) {
            out += '\'' + a + '\'';
        } else {
            out += a;
        }
    }
    return out;
}

} // namespace platform
