#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <string>

#include "bootgate/core/Validation.h"

using namespace bootgate::core;
using std::chrono::milliseconds;

TEST_CASE("validateConnectionSettings accepts the defaults", "[validation]") {
  ConnectionSettings settings;
  std::string errorMessage;

  REQUIRE(validateConnectionSettings(settings, errorMessage));
  REQUIRE(errorMessage.empty());
}

TEST_CASE("validateConnectionSettings rejects bad network fields", "[validation]") {
  std::string errorMessage;

  ConnectionSettings emptyHost;
  emptyHost.host.clear();
  REQUIRE_FALSE(validateConnectionSettings(emptyHost, errorMessage));
  REQUIRE(!errorMessage.empty());

  ConnectionSettings badPort;
  badPort.port = 70000;
  REQUIRE_FALSE(validateConnectionSettings(badPort, errorMessage));

  ConnectionSettings noDatabase;
  noDatabase.database.clear();
  REQUIRE_FALSE(validateConnectionSettings(noDatabase, errorMessage));
}

TEST_CASE("validateConnectionSettings only checks what the driver uses", "[validation]") {
  std::string errorMessage;

  ConnectionSettings tcp;
  tcp.driver = DbDriver::Tcp;
  tcp.user.clear();
  tcp.database.clear();
  REQUIRE(validateConnectionSettings(tcp, errorMessage));

  ConnectionSettings sqlite;
  sqlite.driver = DbDriver::Sqlite;
  sqlite.host.clear();
  sqlite.port = 0;
  REQUIRE(validateConnectionSettings(sqlite, errorMessage));

  sqlite.sqlitePath.clear();
  REQUIRE_FALSE(validateConnectionSettings(sqlite, errorMessage));
}

TEST_CASE("validateRetryPolicy rejects unusable policies", "[validation]") {
  std::string errorMessage;

  REQUIRE(validateRetryPolicy(RetryPolicy(), errorMessage));
  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(0), 1.0, milliseconds(1000), 0), errorMessage));
  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(100), 0.5, milliseconds(1000), 0), errorMessage));
  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(100), 1.0, milliseconds(0), 0), errorMessage));
  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(100), 1.0, milliseconds(1000), -1), errorMessage));
}

TEST_CASE("validateRetryPolicy rejects a multiplier that is not finite", "[validation]") {
  std::string errorMessage;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(100), nan, milliseconds(1000), 0), errorMessage));
  REQUIRE(errorMessage == "Backoff multiplier must be at least 1.0");
  REQUIRE_FALSE(validateRetryPolicy(RetryPolicy(milliseconds(100), inf, milliseconds(1000), 0), errorMessage));
}
