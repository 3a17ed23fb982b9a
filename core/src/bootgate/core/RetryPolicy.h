#pragma once

#include <chrono>
#include <string>

namespace bootgate::core {

// Delay and attempt limits for the readiness loop.
//
// The default policy retries forever with a fixed two-second delay. A multiplier above 1.0 grows
// the delay after each failure up to maxInterval. maxAttempts == 0 means no limit.
class RetryPolicy {
public:
  static constexpr int kUnbounded = 0;
  static constexpr std::chrono::milliseconds kDefaultInterval{2000};
  static constexpr std::chrono::milliseconds kDefaultMaxInterval{30000};

  RetryPolicy();
  RetryPolicy(std::chrono::milliseconds initialInterval, double multiplier, std::chrono::milliseconds maxInterval,
              int maxAttempts);

  std::chrono::milliseconds getInitialInterval() const { return initialInterval_; }
  double getMultiplier() const { return multiplier_; }
  std::chrono::milliseconds getMaxInterval() const { return maxInterval_; }
  int getMaxAttempts() const { return maxAttempts_; }

  bool isUnbounded() const { return maxAttempts_ == kUnbounded; }

  // True if another attempt may follow after attemptsMade attempts have failed.
  bool allowsAnotherAttempt(int attemptsMade) const;

  // Delay to wait after the given number of consecutive failures (1-based).
  std::chrono::milliseconds delayAfterFailure(int failures) const;

private:
  std::chrono::milliseconds initialInterval_;
  double multiplier_;
  std::chrono::milliseconds maxInterval_;
  int maxAttempts_;
};

// Formats a delay for status lines: "2 seconds", "1 second", "250 ms".
std::string formatDelay(std::chrono::milliseconds delay);

}  // namespace bootgate::core
