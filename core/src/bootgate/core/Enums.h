#pragma once

#include <string>

namespace bootgate::core {

enum class DbDriver { Postgres, Sqlite, Tcp };

enum class HandoffMode { Exec, Spawn };

// Convert DbDriver to the lowercase name used in configuration.
inline std::string toString(DbDriver driver) {
  switch (driver) {
    case DbDriver::Postgres:
      return "postgres";
    case DbDriver::Sqlite:
      return "sqlite";
    case DbDriver::Tcp:
      return "tcp";
  }
  return "unknown";
}

// Parse a DbDriver from a string. Accepts "postgresql" as an alias. Returns true on success.
inline bool fromString(const std::string& value, DbDriver& outDriver) {
  if (value == "postgres" || value == "postgresql") {
    outDriver = DbDriver::Postgres;
    return true;
  }
  if (value == "sqlite") {
    outDriver = DbDriver::Sqlite;
    return true;
  }
  if (value == "tcp") {
    outDriver = DbDriver::Tcp;
    return true;
  }
  return false;
}

inline std::string toString(HandoffMode mode) {
  switch (mode) {
    case HandoffMode::Exec:
      return "exec";
    case HandoffMode::Spawn:
      return "spawn";
  }
  return "unknown";
}

// Parse a HandoffMode from a string. Returns true on success.
inline bool fromString(const std::string& value, HandoffMode& outMode) {
  if (value == "exec") {
    outMode = HandoffMode::Exec;
    return true;
  }
  if (value == "spawn") {
    outMode = HandoffMode::Spawn;
    return true;
  }
  return false;
}

}  // namespace bootgate::core
