#pragma once

#include <stdexcept>
#include <string>

namespace bootgate::entrypoint::process {

// Exit codes a shell reports for commands that cannot be run.
constexpr int kExitNotExecutable = 126;
constexpr int kExitNotFound = 127;

// A failure that ends the entrypoint with a specific exit code.
class ProcessError : public std::runtime_error {
public:
    ProcessError(const std::string& message, int exitCode) : std::runtime_error(message), exitCode_(exitCode) {}

    int exitCode() const { return exitCode_; }

private:
    int exitCode_;
};

// Maps a waitpid() status to a shell-style exit code: the exit status, or 128 + signal number.
int exitCodeFromWaitStatus(int status);

// Exit code for a failed execvp() with the given errno.
int exitCodeForExecError(int error);

}  // namespace bootgate::entrypoint::process
