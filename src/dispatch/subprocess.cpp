#include "subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../include/logging.hpp"

extern char** environ;

Subprocess::Subprocess(const std::string& command)
    : pid_(-1), stdin_fd_(-1), reaped_(false) {
    // Both ends close-on-exec: a child spawned concurrently by another
    // worker slot must not inherit this pipe, or our child never sees EOF
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0)
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");

    posix_spawn_file_actions_t actions;
    int rc = posix_spawn_file_actions_init(&actions);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&actions, fds[0], STDIN_FILENO);
    if (rc != 0) {
        close(fds[0]);
        close(fds[1]);
        throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions setup failed");
    }

    const char* argv[] = {"sh", "-c", command.c_str(), nullptr};
    rc = posix_spawn(&pid_, "/bin/sh", &actions, nullptr, const_cast<char* const*>(argv), environ);
    posix_spawn_file_actions_destroy(&actions);

    // the child has its own copy of the read end now
    close(fds[0]);

    if (rc != 0) {
        close(fds[1]);
        pid_ = -1;
        throw std::system_error(rc, std::generic_category(), "cannot spawn: " + command);
    }
    stdin_fd_ = fds[1];
    LOG_TRACE("spawned pid %d: %s", static_cast<int>(pid_), command.c_str());
}

Subprocess::~Subprocess() {
    close_stdin();
    if (pid_ > 0 && !reaped_) {
        try {
            wait();
        } catch (const std::system_error& e) {
            LOG_ERROR("could not reap pid %d: %s", static_cast<int>(pid_), e.what());
        }
    }
}

void Subprocess::write_stdin(const void* data, size_t len) {
    if (stdin_fd_ < 0)
        throw std::system_error(EBADF, std::generic_category(), "stdin of child already closed");

    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        // blocks while the pipe is full, so a slow child throttles us
        ssize_t n = ::write(stdin_fd_, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(),
                                    "write to pid " + std::to_string(pid_) + " failed");
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
}

void Subprocess::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

ExitStatus Subprocess::wait() {
    close_stdin();
    if (reaped_) return status_;

    int wstatus = 0;
    while (waitpid(pid_, &wstatus, 0) < 0) {
        if (errno != EINTR)
            throw std::system_error(errno, std::generic_category(),
                                    "waitpid failed for pid " + std::to_string(pid_));
    }
    reaped_ = true;

    if (WIFEXITED(wstatus)) {
        status_.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        status_.signal = WTERMSIG(wstatus);
    }
    return status_;
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}
