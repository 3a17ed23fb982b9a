#pragma once

#include <string>

#include "db/ReadinessProbe.h"

namespace bootgate::entrypoint::net {

// Ready when any address host resolves to accepts a TCP connection on port. The connection is
// closed immediately; nothing is sent.
class TcpProbe : public db::ReadinessProbe {
public:
    // timeoutSeconds bounds each connect attempt; 0 waits for the operating system's timeout.
    TcpProbe(std::string host, int port, int timeoutSeconds);

    db::ProbeResult probe() override;

private:
    std::string host_;
    int port_;
    int timeoutSeconds_;
};

}  // namespace bootgate::entrypoint::net
