#pragma once

#include <string>

#include "bootgate/core/Enums.h"

namespace bootgate::core {

inline const char kDefaultSqlitePath[] = "./data/db/app.db";

// Endpoint of the database the entrypoint waits for. Only the fields relevant to the selected
// driver are used: postgres uses all network and credential fields, tcp uses host and port,
// sqlite uses sqlitePath.
struct ConnectionSettings {
  DbDriver driver{DbDriver::Postgres};
  std::string host{"db"};
  int port{5432};
  std::string user{"user"};
  std::string password{"password"};
  std::string database{"flight_booking"};
  std::string sqlitePath{kDefaultSqlitePath};
  int connectTimeoutSeconds{5};
};

// Name printed in status lines, e.g. "Postgres" or "db:5432".
std::string targetName(const ConnectionSettings& settings);

// Human-readable endpoint without credentials, e.g. "postgres://user@db:5432/flight_booking".
std::string describeEndpoint(const ConnectionSettings& settings);

}  // namespace bootgate::core
