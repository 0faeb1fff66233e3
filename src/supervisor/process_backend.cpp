// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor/process_backend.h"

#include "supervisor/event_source.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kiosk {

std::string describe_exit(const ChildExit& exit) {
    if (exit.term_signal != 0) {
        return "signal " + std::to_string(exit.term_signal) + " (" + strsignal(exit.term_signal) +
               ")";
    }
    return "exit code " + std::to_string(exit.exit_code);
}

namespace {

ChildExit decode_status(pid_t pid, int status) {
    ChildExit exit;
    exit.pid = pid;
    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.term_signal = WTERMSIG(status);
    }
    return exit;
}

/**
 * @brief fork/exec process backend
 *
 * Commands go through /bin/sh -c so callers can pass the same command lines
 * they would type at a shell. Background commands get their own process
 * group, so kill() also takes down anything the shell started.
 */
class LinuxProcessBackend : public ProcessBackend {
  public:
    CommandOutcome run_captured(const std::string& command, EventSource* events) override {
        CommandOutcome out;
        if (events && events->fd() < 0) {
            events = nullptr;
        }

        int pipefd[2] = {-1, -1};
        if (pipe2(pipefd, O_CLOEXEC) < 0) {
            last_error_ = strerror(errno);
            out.error = "pipe failed: " + last_error_;
            spdlog::error("[Process] {}", out.error);
            return out;
        }

        pid_t pid = fork();
        if (pid < 0) {
            last_error_ = strerror(errno);
            out.error = "fork failed: " + last_error_;
            spdlog::error("[Process] {}", out.error);
            close(pipefd[0]);
            close(pipefd[1]);
            return out;
        }

        if (pid == 0) {
            // Child: stdout into the pipe, then become the shell
            reset_signal_state_for_exec();
            dup2(pipefd[1], STDOUT_FILENO);
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        close(pipefd[1]);
        helper_pid_ = pid;
        helper_exit_.reset();
        out.started = true;
        spdlog::trace("[Process] Helper PID {} running: {}", pid, command);

        read_until_eof(pipefd[0], events, out.output);
        close(pipefd[0]);

        std::optional<ChildExit> exit = wait_for_helper(pid, events);
        helper_pid_ = 0;
        helper_exit_.reset();

        if (!exit) {
            out.error = "lost track of helper PID " + std::to_string(pid);
            return out;
        }

        out.exit_code = exit->exit_code;
        out.term_signal = exit->term_signal;
        if (exit->term_signal != 0) {
            out.error = "killed by " + describe_exit(*exit);
        }
        return out;
    }

    pid_t spawn(const std::string& command) override {
        pid_t pid = fork();
        if (pid < 0) {
            last_error_ = strerror(errno);
            spdlog::error("[Process] fork failed for '{}': {}", command, last_error_);
            return -1;
        }

        if (pid == 0) {
            setpgid(0, 0);
            reset_signal_state_for_exec();
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        // Also set the group from the parent so a kill() issued right away
        // cannot race the child's own setpgid().
        if (setpgid(pid, pid) != 0 && errno != EACCES) {
            spdlog::debug("[Process] setpgid({}) from parent: {}", pid, strerror(errno));
        }
        return pid;
    }

    bool kill(pid_t pid) override {
        if (pid <= 0) {
            last_error_ = "invalid PID";
            return false;
        }
        if (::kill(-pid, SIGKILL) == 0) {
            return true;
        }
        if (errno == ESRCH && ::kill(pid, SIGKILL) == 0) {
            return true;
        }
        last_error_ = strerror(errno);
        spdlog::warn("[Process] kill({}) failed: {}", pid, last_error_);
        return false;
    }

    std::optional<ChildExit> reap() override {
        int status = 0;
        pid_t pid;
        do {
            pid = waitpid(-1, &status, WNOHANG);
        } while (pid < 0 && errno == EINTR);

        if (pid <= 0) {
            return std::nullopt;
        }

        ChildExit exit = decode_status(pid, status);
        if (pid == helper_pid_) {
            // run_captured() is still waiting on this one; hand it the status
            helper_exit_ = exit;
        }
        return exit;
    }

    std::string last_error() const override {
        return last_error_;
    }

    pid_t current_helper() const override {
        return helper_pid_;
    }

  private:
    void read_until_eof(int fd, EventSource* events, std::string& output) {
        std::array<char, 4096> buf;

        while (true) {
            struct pollfd fds[2] = {{fd, POLLIN, 0}, {events ? events->fd() : -1, POLLIN, 0}};
            int ret = poll(fds, events ? 2 : 1, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                spdlog::error("[Process] poll failed: {}", strerror(errno));
                return;
            }

            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(fd, buf.data(), buf.size());
                if (n > 0) {
                    output.append(buf.data(), static_cast<size_t>(n));
                } else if (n == 0) {
                    return;
                } else if (errno != EINTR && errno != EAGAIN) {
                    spdlog::error("[Process] read failed: {}", strerror(errno));
                    return;
                }
            }

            if (events && (fds[1].revents & POLLIN)) {
                events->dispatch();
            }
        }
    }

    std::optional<ChildExit> wait_for_helper(pid_t pid, EventSource* events) {
        while (true) {
            if (helper_exit_) {
                return helper_exit_;
            }

            int status = 0;
            pid_t r = waitpid(pid, &status, events ? WNOHANG : 0);
            if (r == pid) {
                return decode_status(pid, status);
            }
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (helper_exit_) {
                    return helper_exit_;
                }
                spdlog::error("[Process] waitpid({}) failed: {}", pid, strerror(errno));
                return std::nullopt;
            }

            // Still running (stdout closed early): keep servicing events until
            // SIGCHLD shows up. Either the reactor reaps it for us, or the
            // next waitpid() above does.
            struct pollfd pfd = {events->fd(), POLLIN, 0};
            if (poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                spdlog::error("[Process] poll failed: {}", strerror(errno));
                return std::nullopt;
            }
            if (pfd.revents & POLLIN) {
                events->dispatch();
            }
        }
    }

    pid_t helper_pid_ = 0;
    std::optional<ChildExit> helper_exit_;
    std::string last_error_;
};

} // namespace

std::unique_ptr<ProcessBackend> ProcessBackend::create() {
    return std::make_unique<LinuxProcessBackend>();
}

} // namespace kiosk
