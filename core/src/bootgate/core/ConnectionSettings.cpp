#include "bootgate/core/ConnectionSettings.h"

namespace bootgate::core {

std::string targetName(const ConnectionSettings& settings) {
  switch (settings.driver) {
    case DbDriver::Postgres:
      return "Postgres";
    case DbDriver::Sqlite:
      return "SQLite";
    case DbDriver::Tcp:
      return settings.host + ":" + std::to_string(settings.port);
  }
  return "database";
}

std::string describeEndpoint(const ConnectionSettings& settings) {
  switch (settings.driver) {
    case DbDriver::Postgres:
      return "postgres://" + settings.user + "@" + settings.host + ":" + std::to_string(settings.port) + "/" +
             settings.database;
    case DbDriver::Sqlite:
      return "sqlite:" + settings.sqlitePath;
    case DbDriver::Tcp:
      return "tcp://" + settings.host + ":" + std::to_string(settings.port);
  }
  return {};
}

}  // namespace bootgate::core
