#pragma once

#include <string>

#include "db/ReadinessProbe.h"

namespace bootgate::entrypoint::db {

// Ready when the database file exists, opens read-write and answers a catalog query. The probe
// never creates the file; it waits for whoever provisions it.
class SqliteProbe : public ReadinessProbe {
public:
    explicit SqliteProbe(std::string dbPath);

    ProbeResult probe() override;

private:
    std::string dbPath_;
};

}  // namespace bootgate::entrypoint::db
