// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hil {

std::unique_ptr<ProcessRunner> ProcessRunner::create() {
    return std::make_unique<PosixProcessRunner>();
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.empty() || arg.find(' ') != std::string::npos) {
            line += "'" + arg + "'";
        } else {
            line += arg;
        }
    }
    return line;
}

namespace {

/**
 * @brief Pipe file descriptor pair closed on scope exit
 */
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() {
        return pipe(fds) == 0;
    }

    void close_read() {
        if (fds[0] >= 0) {
            close(fds[0]);
            fds[0] = -1;
        }
    }

    void close_write() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }
};

/// Drain both pipes until EOF on each, handling EINTR
void drain_pipes(Pipe& out_pipe, Pipe& err_pipe, std::string& out, std::string& err) {
    std::array<char, 4096> buf;
    struct pollfd pfds[2];
    pfds[0].fd = out_pipe.fds[0];
    pfds[0].events = POLLIN;
    pfds[1].fd = err_pipe.fds[0];
    pfds[1].events = POLLIN;

    int open_count = 2;
    while (open_count > 0) {
        int ret = poll(pfds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[ProcessRunner] poll() failed: {}", strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) {
                continue;
            }
            ssize_t len = read(pfds[i].fd, buf.data(), buf.size());
            if (len > 0) {
                (i == 0 ? out : err).append(buf.data(), static_cast<size_t>(len));
            } else if (len == 0 || errno != EINTR) {
                // EOF or hard error: stop watching this descriptor
                pfds[i].fd = -1;
                --open_count;
            }
        }
    }
}

/// Blocking waitpid that retries on EINTR
int wait_for_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[ProcessRunner] waitpid error: {}", strerror(errno));
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    if (request.argv.empty()) {
        result.launch_failed = true;
        result.error_message = "empty command";
        return result;
    }

    spdlog::debug("[ProcessRunner] exec: {}", format_command_line(request.argv));

    Pipe out_pipe;
    Pipe err_pipe;
    if (request.capture_output && (!out_pipe.open() || !err_pipe.open())) {
        result.launch_failed = true;
        result.error_message = strerror(errno);
        spdlog::error("[ProcessRunner] pipe() failed: {}", result.error_message);
        return result;
    }

    // Build argv before forking; only async-signal-safe calls happen in the child
    std::vector<char*> c_argv;
    c_argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        result.launch_failed = true;
        result.error_message = strerror(errno);
        spdlog::error("[ProcessRunner] Fork failed: {}", result.error_message);
        return result;
    }

    if (pid == 0) {
        if (request.capture_output) {
            dup2(out_pipe.fds[1], STDOUT_FILENO);
            dup2(err_pipe.fds[1], STDERR_FILENO);
            close(out_pipe.fds[0]);
            close(out_pipe.fds[1]);
            close(err_pipe.fds[0]);
            close(err_pipe.fds[1]);
        }
        if (!request.working_dir.empty() && chdir(request.working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    if (request.capture_output) {
        out_pipe.close_write();
        err_pipe.close_write();
        drain_pipes(out_pipe, err_pipe, result.std_out, result.std_err);
    }

    result.exit_code = wait_for_child(pid);

    if (result.exit_code == 127) {
        spdlog::debug("[ProcessRunner] '{}' exited with 127 (exec failure or not found)",
                      request.argv[0]);
    }
    return result;
}

} // namespace hil
