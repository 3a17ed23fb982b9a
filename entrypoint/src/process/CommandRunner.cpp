#include "process/CommandRunner.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "process/Argv.h"
#include "process/ProcessError.h"

namespace bootgate::entrypoint::process {

int exitCodeFromWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

int exitCodeForExecError(int error) { return error == ENOENT ? kExitNotFound : kExitNotExecutable; }

int ChildProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    auto args = makeArgv(argv);

    // Flush buffered status lines so they are not duplicated into the child.
    std::fflush(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork() failed");
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        const int error = errno;
        std::fprintf(stderr, "Error: cannot execute %s: %s\n", args[0], std::strerror(error));
        ::_exit(exitCodeForExecError(error));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid() failed");
        }
    }

    return exitCodeFromWaitStatus(status);
}

}  // namespace bootgate::entrypoint::process
