#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "bootgate/core/Serialization.h"

using namespace bootgate::core;
using nlohmann::json;

TEST_CASE("ConnectionSettings JSON overlays only the given fields", "[serialization]") {
  ConnectionSettings settings;
  auto j = json::parse(R"({"host": "postgres.internal", "port": 6432})");

  from_json(j, settings);

  REQUIRE(settings.host == "postgres.internal");
  REQUIRE(settings.port == 6432);
  REQUIRE(settings.user == "user");
  REQUIRE(settings.database == "flight_booking");
}

TEST_CASE("ConnectionSettings JSON reads every field", "[serialization]") {
  auto j = json::parse(R"({
    "driver": "sqlite", "host": "h", "port": 1, "user": "u", "password": "p",
    "name": "n", "path": "/tmp/x.db", "connectTimeoutSeconds": 9
  })");

  auto settings = j.get<ConnectionSettings>();

  REQUIRE(settings.driver == DbDriver::Sqlite);
  REQUIRE(settings.host == "h");
  REQUIRE(settings.port == 1);
  REQUIRE(settings.user == "u");
  REQUIRE(settings.password == "p");
  REQUIRE(settings.database == "n");
  REQUIRE(settings.sqlitePath == "/tmp/x.db");
  REQUIRE(settings.connectTimeoutSeconds == 9);

  json out = settings;
  REQUIRE(out.at("driver") == "sqlite");
  REQUIRE(out.at("name") == "n");
}

TEST_CASE("ConnectionSettings JSON rejects unknown keys and wrong types", "[serialization]") {
  ConnectionSettings settings;

  REQUIRE_THROWS_AS(from_json(json::parse(R"({"hostname": "db"})"), settings), std::runtime_error);
  REQUIRE_THROWS_AS(from_json(json::parse(R"({"port": "5432"})"), settings), std::runtime_error);
  REQUIRE_THROWS_AS(from_json(json::parse(R"({"driver": "oracle"})"), settings), std::runtime_error);
  REQUIRE_THROWS_AS(from_json(json::parse(R"([1, 2])"), settings), std::runtime_error);
}

TEST_CASE("RetryPolicy JSON keeps unspecified values", "[serialization]") {
  RetryPolicy policy;

  from_json(json::parse(R"({"maxAttempts": 10, "backoffMultiplier": 1.5})"), policy);

  REQUIRE(policy.getMaxAttempts() == 10);
  REQUIRE(policy.getMultiplier() == 1.5);
  REQUIRE(policy.getInitialInterval() == std::chrono::milliseconds(2000));

  json out = policy;
  REQUIRE(out.at("intervalMs") == 2000);
  REQUIRE(out.at("maxAttempts") == 10);
}

TEST_CASE("HandoffMode JSON uses lowercase names", "[serialization]") {
  json j = HandoffMode::Spawn;
  REQUIRE(j == "spawn");

  REQUIRE(json("exec").get<HandoffMode>() == HandoffMode::Exec);
  REQUIRE_THROWS_AS(json("fork").get<HandoffMode>(), std::runtime_error);
  REQUIRE_THROWS_AS(json(3).get<HandoffMode>(), std::runtime_error);
}

TEST_CASE("Integer fields outside the int range are rejected", "[serialization]") {
  RetryPolicy policy;
  ConnectionSettings settings;

  REQUIRE_THROWS_AS(from_json(json::parse(R"({"maxAttempts": 4294967296})"), policy), std::runtime_error);
  REQUIRE_THROWS_AS(from_json(json::parse(R"({"intervalMs": -4294967296})"), policy), std::runtime_error);
  REQUIRE_THROWS_AS(from_json(json::parse(R"({"port": 4294972728})"), settings), std::runtime_error);

  REQUIRE(policy.getMaxAttempts() == RetryPolicy::kUnbounded);
  REQUIRE(settings.port == 5432);

  from_json(json::parse(R"({"maxAttempts": 2147483647})"), policy);
  REQUIRE(policy.getMaxAttempts() == 2147483647);
}
