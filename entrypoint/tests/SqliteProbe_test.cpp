#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <sqlite3.h>

#include "db/SqliteProbe.h"

using bootgate::entrypoint::db::SqliteProbe;

namespace {
std::filesystem::path makeTempDbPath(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    if (std::filesystem::exists(path)) {
        std::filesystem::remove(path);
    }
    return path;
}

void createDatabase(const std::filesystem::path& path, const std::string& sql) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    int result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_close(db);
    REQUIRE(result == SQLITE_OK);
}
}  // namespace

TEST_CASE("SqliteProbe waits for the database file to appear", "[db][sqlite][probe]") {
    auto dbPath = makeTempDbPath("bootgate_sqlite_probe.db");
    SqliteProbe probe(dbPath.string());

    auto missing = probe.probe();
    REQUIRE_FALSE(missing.ready);
    REQUIRE_FALSE(missing.message.empty());
    REQUIRE_FALSE(std::filesystem::exists(dbPath));

    createDatabase(dbPath, "CREATE TABLE flights(id INTEGER PRIMARY KEY)");

    auto present = probe.probe();
    REQUIRE(present.ready);
    REQUIRE(present.message.empty());

    std::filesystem::remove(dbPath);
}

TEST_CASE("SqliteProbe accepts an empty database file", "[db][sqlite][probe]") {
    auto dbPath = makeTempDbPath("bootgate_sqlite_probe_empty.db");
    { std::ofstream touch(dbPath); }

    SqliteProbe probe(dbPath.string());
    REQUIRE(probe.probe().ready);

    std::filesystem::remove(dbPath);
}

TEST_CASE("SqliteProbe rejects files that are not databases", "[db][sqlite][probe]") {
    auto dbPath = makeTempDbPath("bootgate_sqlite_probe_garbage.db");
    {
        std::ofstream out(dbPath);
        out << std::string(4096, 'x');
    }

    SqliteProbe probe(dbPath.string());
    auto result = probe.probe();
    REQUIRE_FALSE(result.ready);
    REQUIRE_FALSE(result.message.empty());

    std::filesystem::remove(dbPath);
}
