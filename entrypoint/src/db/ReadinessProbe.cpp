#include "db/ReadinessProbe.h"

#include <stdexcept>

#include "db/PostgresProbe.h"
#include "db/SqliteProbe.h"
#include "net/TcpProbe.h"

namespace bootgate::entrypoint::db {

std::unique_ptr<ReadinessProbe> makeReadinessProbe(const core::ConnectionSettings& settings) {
    switch (settings.driver) {
        case core::DbDriver::Postgres:
            return std::make_unique<PostgresProbe>(settings);
        case core::DbDriver::Sqlite:
            return std::make_unique<SqliteProbe>(settings.sqlitePath);
        case core::DbDriver::Tcp:
            return std::make_unique<net::TcpProbe>(settings.host, settings.port, settings.connectTimeoutSeconds);
    }
    throw std::invalid_argument("Unsupported database driver");
}

}  // namespace bootgate::entrypoint::db
