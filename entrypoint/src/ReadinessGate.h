#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

#include "Log.h"
#include "bootgate/core/RetryPolicy.h"
#include "db/ReadinessProbe.h"

namespace bootgate::entrypoint {

// Thrown when a bounded retry policy runs out of attempts.
class ReadinessTimeout : public std::runtime_error {
public:
    ReadinessTimeout(const std::string& target, int attempts);

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Sleeps the calling thread.
Sleeper threadSleeper();

// attempts + 1, saturating at INT_MAX for unbounded waits.
int countAttempt(int attempts);

// Blocks startup until the probe reports the database ready.
//
// Prints "Waiting for <target> readiness..." once, one "  <target> not ready. Retrying in <delay>..."
// line per failed attempt that is followed by another attempt, and "<target> ready." on success.
// Every failure is treated alike; there is no distinction between refused connections and bad
// credentials.
class ReadinessGate {
public:
    ReadinessGate(db::ReadinessProbe& probe, core::RetryPolicy policy, std::string target, Logger& logger,
                  Sleeper sleeper = threadSleeper());

    // Returns the number of attempts made, including the successful one.
    int waitUntilReady();

private:
    db::ReadinessProbe& probe_;
    core::RetryPolicy policy_;
    std::string target_;
    Logger& logger_;
    Sleeper sleeper_;
};

}  // namespace bootgate::entrypoint
