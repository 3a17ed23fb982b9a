#pragma once

#include <string>
#include <vector>

namespace bootgate::entrypoint::process {

// Runs an external command to completion.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Returns the command's shell-style exit code (see exitCodeFromWaitStatus).
    virtual int run(const std::vector<std::string>& argv) = 0;
};

// Forks a child that inherits stdin, stdout and stderr, looks the program up in PATH and waits
// for it. A program that cannot be executed yields 127 or 126 like a shell would.
class ChildProcessRunner : public CommandRunner {
public:
    int run(const std::vector<std::string>& argv) override;
};

}  // namespace bootgate::entrypoint::process
