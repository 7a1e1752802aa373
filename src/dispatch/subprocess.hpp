#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <cstddef>
#include <string>

#include <sys/types.h>

struct ExitStatus {
    int exit_code = -1;   // valid when signal == 0
    int signal = 0;       // terminating signal, 0 if the child exited normally

    bool ok() const { return signal == 0 && exit_code == 0; }
};

// A shell command running as a child process with its standard input
// connected to a pipe owned by this object.
//
// The write end is closed and the child reaped on destruction if the
// caller did not do it, so no descriptor or zombie outlives the object.
class Subprocess {
public:
    // Spawn `/bin/sh -c command`. Throws std::system_error if the pipe or
    // the spawn fails.
    explicit Subprocess(const std::string& command);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t pid() const { return pid_; }

    // Write everything to the child's stdin. Throws std::system_error
    // (EPIPE when the child stopped reading early).
    void write_stdin(const void* data, size_t len);

    // Signal end of input. Safe to call more than once.
    void close_stdin();

    // Wait for the child to exit. Closes stdin first if still open.
    ExitStatus wait();

private:
    pid_t pid_;
    int stdin_fd_;
    bool reaped_;
    ExitStatus status_;
};

// Make writes to a closed pipe fail with EPIPE instead of killing the process.
void ignore_sigpipe();

#endif // SUBPROCESS_HPP
