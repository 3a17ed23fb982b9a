#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>

#include "bootgate/core/RetryPolicy.h"

using namespace bootgate::core;
using std::chrono::milliseconds;

TEST_CASE("Default retry policy waits two seconds forever", "[retry]") {
  RetryPolicy policy;

  REQUIRE(policy.isUnbounded());
  REQUIRE(policy.getInitialInterval() == milliseconds(2000));
  REQUIRE(policy.allowsAnotherAttempt(1));
  REQUIRE(policy.allowsAnotherAttempt(1000000));
  REQUIRE(policy.delayAfterFailure(1) == milliseconds(2000));
  REQUIRE(policy.delayAfterFailure(50) == milliseconds(2000));
}

TEST_CASE("Bounded retry policy stops after max attempts", "[retry]") {
  RetryPolicy policy(milliseconds(100), 1.0, milliseconds(1000), 3);

  REQUIRE_FALSE(policy.isUnbounded());
  REQUIRE(policy.allowsAnotherAttempt(0));
  REQUIRE(policy.allowsAnotherAttempt(2));
  REQUIRE_FALSE(policy.allowsAnotherAttempt(3));
}

TEST_CASE("Backoff grows the delay and caps it at the max interval", "[retry]") {
  RetryPolicy policy(milliseconds(100), 2.0, milliseconds(1000), RetryPolicy::kUnbounded);

  REQUIRE(policy.delayAfterFailure(1) == milliseconds(100));
  REQUIRE(policy.delayAfterFailure(2) == milliseconds(200));
  REQUIRE(policy.delayAfterFailure(3) == milliseconds(400));
  REQUIRE(policy.delayAfterFailure(4) == milliseconds(800));
  REQUIRE(policy.delayAfterFailure(5) == milliseconds(1000));
  REQUIRE(policy.delayAfterFailure(10000) == milliseconds(1000));
}

TEST_CASE("Max interval below the initial interval does not shrink the delay", "[retry]") {
  RetryPolicy policy(milliseconds(5000), 3.0, milliseconds(1000), RetryPolicy::kUnbounded);

  REQUIRE(policy.delayAfterFailure(1) == milliseconds(5000));
  REQUIRE(policy.delayAfterFailure(4) == milliseconds(5000));
}

TEST_CASE("A multiplier that is not finite keeps the initial interval", "[retry]") {
  RetryPolicy nanPolicy(milliseconds(100), std::numeric_limits<double>::quiet_NaN(), milliseconds(1000), 0);
  RetryPolicy infPolicy(milliseconds(100), std::numeric_limits<double>::infinity(), milliseconds(1000), 0);

  REQUIRE(nanPolicy.delayAfterFailure(2) == milliseconds(100));
  REQUIRE(infPolicy.delayAfterFailure(3) == milliseconds(100));
}

TEST_CASE("formatDelay prefers whole seconds", "[retry]") {
  REQUIRE(formatDelay(milliseconds(2000)) == "2 seconds");
  REQUIRE(formatDelay(milliseconds(1000)) == "1 second");
  REQUIRE(formatDelay(milliseconds(1500)) == "1500 ms");
  REQUIRE(formatDelay(milliseconds(0)) == "0 ms");
}
