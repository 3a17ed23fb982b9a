#pragma once

#include <string>
#include <vector>

namespace bootgate::entrypoint::process {

// Transfers control to the application command.
class ProcessHandoff {
public:
    virtual ~ProcessHandoff() = default;

    // Returns the exit code the entrypoint should end with. Implementations that replace the
    // process image do not return on success.
    virtual int handoff(const std::vector<std::string>& argv) = 0;
};

// Replaces the current process image with argv (execvp). The process id, open standard streams
// and signal delivery carry over to the application. Throws ProcessError (exit code 127 or 126)
// if the program cannot be executed.
class ExecHandoff : public ProcessHandoff {
public:
    int handoff(const std::vector<std::string>& argv) override;
};

// Runs argv as a child process instead, for environments where in-place replacement is not
// wanted. SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGUSR1 and SIGUSR2 received by the entrypoint are
// forwarded to the child; the child's exit code (128 + signal if it was killed) is returned.
// Previous signal dispositions are restored before returning.
class SpawnHandoff : public ProcessHandoff {
public:
    int handoff(const std::vector<std::string>& argv) override;
};

}  // namespace bootgate::entrypoint::process
