#pragma once

#include <string>
#include <utility>
#include <vector>

#include "bootgate/core/ConnectionSettings.h"
#include "db/ReadinessProbe.h"

namespace bootgate::entrypoint::db {

// Ready when libpq reaches CONNECTION_OK with the configured credentials. Authentication failures
// and unknown databases are reported as "not ready" like any other connection error.
class PostgresProbe : public ReadinessProbe {
public:
    explicit PostgresProbe(core::ConnectionSettings settings);

    ProbeResult probe() override;

    // libpq keyword/value pairs used for the connection, in order.
    std::vector<std::pair<std::string, std::string>> connectionParameters() const;

private:
    core::ConnectionSettings settings_;
};

}  // namespace bootgate::entrypoint::db
