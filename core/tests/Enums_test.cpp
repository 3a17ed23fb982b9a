#include <catch2/catch_test_macros.hpp>

#include "bootgate/core/Enums.h"

using namespace bootgate::core;

TEST_CASE("DbDriver string conversion succeeds for known values", "[enums]") {
  REQUIRE(toString(DbDriver::Postgres) == "postgres");
  REQUIRE(toString(DbDriver::Sqlite) == "sqlite");
  REQUIRE(toString(DbDriver::Tcp) == "tcp");

  DbDriver driver{};
  REQUIRE(fromString("sqlite", driver));
  REQUIRE(driver == DbDriver::Sqlite);
  REQUIRE(fromString("tcp", driver));
  REQUIRE(driver == DbDriver::Tcp);
  REQUIRE(fromString("postgresql", driver));
  REQUIRE(driver == DbDriver::Postgres);
}

TEST_CASE("Enum parsing rejects unknown values", "[enums]") {
  DbDriver driver = DbDriver::Sqlite;
  REQUIRE_FALSE(fromString("mysql", driver));
  REQUIRE(driver == DbDriver::Sqlite);

  HandoffMode mode = HandoffMode::Spawn;
  REQUIRE_FALSE(fromString("EXEC", mode));
  REQUIRE(mode == HandoffMode::Spawn);
  REQUIRE(fromString("exec", mode));
  REQUIRE(mode == HandoffMode::Exec);
}
