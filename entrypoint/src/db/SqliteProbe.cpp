#include "db/SqliteProbe.h"

#include <stdexcept>
#include <utility>

#include "db/SqliteConnection.h"

namespace bootgate::entrypoint::db {

SqliteProbe::SqliteProbe(std::string dbPath) : dbPath_(std::move(dbPath)) {}

ProbeResult SqliteProbe::probe() {
    try {
        SqliteConnection connection(dbPath_);
        connection.open();
        // Also rejects files that exist but are not SQLite databases.
        connection.query("SELECT count(*) AS tables FROM sqlite_master");
        return {true, {}};
    } catch (const std::runtime_error& ex) {
        return {false, ex.what()};
    }
}

}  // namespace bootgate::entrypoint::db
