#pragma once

#include <memory>
#include <string>

#include "bootgate/core/ConnectionSettings.h"

namespace bootgate::entrypoint::db {

struct ProbeResult {
    bool ready{false};
    // Failure detail from the driver; empty on success.
    std::string message;
};

// One connection attempt against the database endpoint. Implementations open a fresh
// connection per call and release it before returning.
class ReadinessProbe {
public:
    virtual ~ReadinessProbe() = default;

    virtual ProbeResult probe() = 0;
};

// Creates the probe for settings.driver.
std::unique_ptr<ReadinessProbe> makeReadinessProbe(const core::ConnectionSettings& settings);

}  // namespace bootgate::entrypoint::db
