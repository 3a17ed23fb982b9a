#include "ReadinessGate.h"

#include <limits>
#include <thread>
#include <utility>

namespace bootgate::entrypoint {

ReadinessTimeout::ReadinessTimeout(const std::string& target, int attempts)
    : std::runtime_error(target + " not ready after " + std::to_string(attempts) +
                         (attempts == 1 ? " attempt" : " attempts")),
      attempts_(attempts) {}

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

int countAttempt(int attempts) {
    return attempts < std::numeric_limits<int>::max() ? attempts + 1 : attempts;
}

ReadinessGate::ReadinessGate(db::ReadinessProbe& probe, core::RetryPolicy policy, std::string target,
                             Logger& logger, Sleeper sleeper)
    : probe_(probe),
      policy_(std::move(policy)),
      target_(std::move(target)),
      logger_(logger),
      sleeper_(std::move(sleeper)) {}

int ReadinessGate::waitUntilReady() {
    logger_.status("Waiting for " + target_ + " readiness...");

    int attempts = 0;
    while (true) {
        attempts = countAttempt(attempts);
        auto result = probe_.probe();
        if (result.ready) {
            logger_.debug("Connected after " + std::to_string(attempts) + " attempt(s)");
            logger_.status(target_ + " ready.");
            return attempts;
        }

        logger_.debug("Attempt " + std::to_string(attempts) + " failed: " + result.message);

        if (!policy_.allowsAnotherAttempt(attempts)) {
            throw ReadinessTimeout(target_, attempts);
        }

        const auto delay = policy_.delayAfterFailure(attempts);
        logger_.status("  " + target_ + " not ready. Retrying in " + core::formatDelay(delay) + "...");
        sleeper_(delay);
    }
}

}  // namespace bootgate::entrypoint
