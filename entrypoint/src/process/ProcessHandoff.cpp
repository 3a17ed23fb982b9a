#include "process/ProcessHandoff.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "process/Argv.h"
#include "process/ProcessError.h"

namespace bootgate::entrypoint::process {

namespace {

constexpr std::array<int, 6> kForwardedSignals{SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2};

volatile sig_atomic_t forwardTarget = 0;

void forwardSignal(int signalNumber) {
    const pid_t child = forwardTarget;
    if (child > 0) {
        ::kill(child, signalNumber);
    }
}

sigset_t forwardedSignalSet() {
    sigset_t set;
    sigemptyset(&set);
    for (int signalNumber : kForwardedSignals) {
        sigaddset(&set, signalNumber);
    }
    return set;
}

// Installs the forwarding handler for the lifetime of the object and restores the previous
// dispositions afterwards.
class SignalForwarding {
public:
    SignalForwarding() {
        struct sigaction action {};
        action.sa_handler = forwardSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        for (std::size_t i = 0; i < kForwardedSignals.size(); ++i) {
            if (::sigaction(kForwardedSignals[i], &action, &previous_[i]) < 0) {
                const int error = errno;
                restore(i);
                throw std::system_error(error, std::generic_category(), "sigaction() failed");
            }
        }
    }

    ~SignalForwarding() {
        forwardTarget = 0;
        restore(kForwardedSignals.size());
    }

    SignalForwarding(const SignalForwarding&) = delete;
    SignalForwarding& operator=(const SignalForwarding&) = delete;

private:
    void restore(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            ::sigaction(kForwardedSignals[i], &previous_[i], nullptr);
        }
    }

    std::array<struct sigaction, kForwardedSignals.size()> previous_{};
};

// Blocks the forwarded signals in the calling thread until destroyed.
class SignalBlock {
public:
    SignalBlock() {
        const sigset_t set = forwardedSignalSet();
        const int rc = ::pthread_sigmask(SIG_BLOCK, &set, &previous_);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "pthread_sigmask() failed");
        }
    }

    ~SignalBlock() { ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr); }

    SignalBlock(const SignalBlock&) = delete;
    SignalBlock& operator=(const SignalBlock&) = delete;

    const sigset_t& previous() const { return previous_; }

private:
    sigset_t previous_{};
};

}  // namespace

int ExecHandoff::handoff(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Missing application command");
    }

    auto args = makeArgv(argv);
    std::fflush(nullptr);
    ::execvp(args[0], args.data());

    const int error = errno;
    throw ProcessError("cannot execute " + argv.front() + ": " + std::strerror(error), exitCodeForExecError(error));
}

int SpawnHandoff::handoff(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Missing application command");
    }

    auto args = makeArgv(argv);
    std::fflush(nullptr);

    SignalForwarding forwarding;
    pid_t pid;
    {
        // Signals arriving before the child pid is known stay pending and are forwarded once the
        // block is lifted.
        SignalBlock block;

        pid = ::fork();
        if (pid < 0) {
            throw std::system_error(errno, std::generic_category(), "fork() failed");
        }

        if (pid == 0) {
            ::pthread_sigmask(SIG_SETMASK, &block.previous(), nullptr);
            ::execvp(args[0], args.data());
            const int error = errno;
            std::fprintf(stderr, "Error: cannot execute %s: %s\n", args[0], std::strerror(error));
            ::_exit(exitCodeForExecError(error));
        }

        forwardTarget = pid;
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
