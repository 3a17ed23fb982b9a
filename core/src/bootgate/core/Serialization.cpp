#include "bootgate/core/Serialization.h"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>

using nlohmann::json;

namespace bootgate::core {
namespace {

void rejectUnknownKeys(const json& j, const std::string& what, std::initializer_list<const char*> allowed) {
  for (const auto& item : j.items()) {
    bool known = false;
    for (const char* key : allowed) {
      if (item.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw std::runtime_error("Unknown field in " + what + ": " + item.key());
    }
  }
}

void readString(const json& j, const std::string& key, std::string& out) {
  if (!j.contains(key)) {
    return;
  }
  const auto& value = j.at(key);
  if (!value.is_string()) {
    throw std::runtime_error("Field '" + key + "' must be a string");
  }
  out = value.get<std::string>();
}

void readInteger(const json& j, const std::string& key, int& out) {
  if (!j.contains(key)) {
    return;
  }
  const auto& value = j.at(key);
  if (!value.is_number_integer()) {
    throw std::runtime_error("Field '" + key + "' must be an integer");
  }
  // get<int>() narrows silently.
  const bool inRange =
      value.is_number_unsigned()
          ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
          : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                value.get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!inRange) {
    throw std::runtime_error("Field '" + key + "' out of range");
  }
  out = value.get<int>();
}

void readNumber(const json& j, const std::string& key, double& out) {
  if (!j.contains(key)) {
    return;
  }
  const auto& value = j.at(key);
  if (!value.is_number()) {
    throw std::runtime_error("Field '" + key + "' must be a number");
  }
  out = value.get<double>();
}

}  // namespace

void to_json(json& j, const DbDriver& driver) { j = toString(driver); }

void from_json(const json& j, DbDriver& driver) {
  if (!j.is_string()) {
    throw std::runtime_error("DbDriver must be a string");
  }
  const auto raw = j.get<std::string>();
  if (!fromString(raw, driver)) {
    throw std::runtime_error("Invalid DbDriver: " + raw);
  }
}

void to_json(json& j, const HandoffMode& mode) { j = toString(mode); }

void from_json(const json& j, HandoffMode& mode) {
  if (!j.is_string()) {
    throw std::runtime_error("HandoffMode must be a string");
  }
  const auto raw = j.get<std::string>();
  if (!fromString(raw, mode)) {
    throw std::runtime_error("Invalid HandoffMode: " + raw);
  }
}

void to_json(json& j, const ConnectionSettings& settings) {
  j = json{{"driver", settings.driver},
           {"host", settings.host},
           {"port", settings.port},
           {"user", settings.user},
           {"password", settings.password},
           {"name", settings.database},
           {"path", settings.sqlitePath},
           {"connectTimeoutSeconds", settings.connectTimeoutSeconds}};
}

void from_json(const json& j, ConnectionSettings& settings) {
  if (!j.is_object()) {
    throw std::runtime_error("ConnectionSettings must be an object");
  }
  rejectUnknownKeys(j, "database settings",
                    {"driver", "host", "port", "user", "password", "name", "path", "connectTimeoutSeconds"});

  if (j.contains("driver")) {
    from_json(j.at("driver"), settings.driver);
  }
  readString(j, "host", settings.host);
  readInteger(j, "port", settings.port);
  readString(j, "user", settings.user);
  readString(j, "password", settings.password);
  readString(j, "name", settings.database);
  readString(j, "path", settings.sqlitePath);
  readInteger(j, "connectTimeoutSeconds", settings.connectTimeoutSeconds);
}

void to_json(json& j, const RetryPolicy& policy) {
  j = json{{"intervalMs", policy.getInitialInterval().count()},
           {"backoffMultiplier", policy.getMultiplier()},
           {"maxIntervalMs", policy.getMaxInterval().count()},
           {"maxAttempts", policy.getMaxAttempts()}};
}

void from_json(const json& j, RetryPolicy& policy) {
  if (!j.is_object()) {
    throw std::runtime_error("RetryPolicy must be an object");
  }
  rejectUnknownKeys(j, "retry settings", {"intervalMs", "backoffMultiplier", "maxIntervalMs", "maxAttempts"});

  int intervalMs = static_cast<int>(policy.getInitialInterval().count());
  double multiplier = policy.getMultiplier();
  int maxIntervalMs = static_cast<int>(policy.getMaxInterval().count());
  int maxAttempts = policy.getMaxAttempts();

  readInteger(j, "intervalMs", intervalMs);
  readNumber(j, "backoffMultiplier", multiplier);
  readInteger(j, "maxIntervalMs", maxIntervalMs);
  readInteger(j, "maxAttempts", maxAttempts);

  policy = RetryPolicy(std::chrono::milliseconds(intervalMs), multiplier, std::chrono::milliseconds(maxIntervalMs),
                       maxAttempts);
}

}  // namespace bootgate::core
