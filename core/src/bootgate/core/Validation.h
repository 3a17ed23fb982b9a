#pragma once

#include <string>

#include "bootgate/core/ConnectionSettings.h"
#include "bootgate/core/RetryPolicy.h"

namespace bootgate::core {

// Checks the fields the selected driver needs and returns a descriptive error on failure.
bool validateConnectionSettings(const ConnectionSettings& settings, std::string& errorMessage);

// Rejects non-positive intervals, multipliers below 1.0 and negative attempt limits.
bool validateRetryPolicy(const RetryPolicy& policy, std::string& errorMessage);

}  // namespace bootgate::core
