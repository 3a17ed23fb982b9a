#include "bootgate/core/RetryPolicy.h"

#include <algorithm>
#include <cmath>

namespace bootgate::core {

RetryPolicy::RetryPolicy() : RetryPolicy(kDefaultInterval, 1.0, kDefaultMaxInterval, kUnbounded) {}

RetryPolicy::RetryPolicy(std::chrono::milliseconds initialInterval, double multiplier,
                         std::chrono::milliseconds maxInterval, int maxAttempts)
    : initialInterval_(initialInterval),
      multiplier_(multiplier),
      maxInterval_(maxInterval),
      maxAttempts_(maxAttempts) {}

bool RetryPolicy::allowsAnotherAttempt(int attemptsMade) const {
  return isUnbounded() || attemptsMade < maxAttempts_;
}

std::chrono::milliseconds RetryPolicy::delayAfterFailure(int failures) const {
  if (!(multiplier_ > 1.0) || !std::isfinite(multiplier_) || failures <= 1) {
    return initialInterval_;
  }

  // The cap never shrinks the configured initial interval.
  const double cap = static_cast<double>(std::max(maxInterval_, initialInterval_).count());
  double delay = static_cast<double>(initialInterval_.count());
  for (int i = 1; i < failures && delay < cap; ++i) {
    delay *= multiplier_;
  }
  return std::chrono::milliseconds(static_cast<long long>(std::min(std::floor(delay), cap)));
}

std::string formatDelay(std::chrono::milliseconds delay) {
  const auto count = delay.count();
  if (count > 0 && count % 1000 == 0) {
    const auto seconds = count / 1000;
    return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
  }
  return std::to_string(count) + " ms";
}

}  // namespace bootgate::core
