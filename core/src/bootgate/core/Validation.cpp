#include "bootgate/core/Validation.h"

#include <cmath>

namespace bootgate::core {

bool validateConnectionSettings(const ConnectionSettings& settings, std::string& errorMessage) {
  if (settings.driver == DbDriver::Sqlite) {
    if (settings.sqlitePath.empty()) {
      errorMessage = "SQLite database path must not be empty";
      return false;
    }
    return true;
  }

  if (settings.host.empty()) {
    errorMessage = "Database host must not be empty";
    return false;
  }
  if (settings.port <= 0 || settings.port > 65535) {
    errorMessage = "Database port out of range: " + std::to_string(settings.port);
    return false;
  }
  if (settings.connectTimeoutSeconds < 0) {
    errorMessage = "Connect timeout must not be negative";
    return false;
  }

  if (settings.driver == DbDriver::Postgres) {
    if (settings.user.empty()) {
      errorMessage = "Database user must not be empty";
      return false;
    }
    if (settings.database.empty()) {
      errorMessage = "Database name must not be empty";
      return false;
    }
  }

  return true;
}

bool validateRetryPolicy(const RetryPolicy& policy, std::string& errorMessage) {
  if (policy.getInitialInterval().count() <= 0) {
    errorMessage = "Retry interval must be positive";
    return false;
  }
  if (!std::isfinite(policy.getMultiplier()) || policy.getMultiplier() < 1.0) {
    errorMessage = "Backoff multiplier must be at least 1.0";
    return false;
  }
  if (policy.getMaxInterval().count() <= 0) {
    errorMessage = "Maximum retry interval must be positive";
    return false;
  }
  if (policy.getMaxAttempts() < 0) {
    errorMessage = "Maximum attempts must not be negative";
    return false;
  }
  return true;
}

}  // namespace bootgate::core
