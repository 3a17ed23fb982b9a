#include "db/PostgresProbe.h"

#include <catch2/catch_test_macros.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <map>
#include <string>

#include "db/ReadinessProbe.h"
#include "db/SqliteProbe.h"
#include "net/TcpProbe.h"

namespace bootgate::entrypoint::db {

namespace {
int reservePort() {
    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(sock >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    REQUIRE(::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    int port = ntohs(addr.sin_port);
    ::close(sock);
    return port;
}
}  // namespace

TEST_CASE("PostgresProbe passes every connection setting to libpq", "[db][postgres]") {
    core::ConnectionSettings settings;
    settings.host = "postgres.internal";
    settings.port = 6432;
    settings.user = "app";
    settings.password = "secret";
    settings.database = "bookings";
    settings.connectTimeoutSeconds = 3;

    PostgresProbe probe(settings);
    std::map<std::string, std::string> parameters;
    for (const auto& [keyword, value] : probe.connectionParameters()) {
        parameters[keyword] = value;
    }

    REQUIRE(parameters.at("host") == "postgres.internal");
    REQUIRE(parameters.at("port") == "6432");
    REQUIRE(parameters.at("user") == "app");
    REQUIRE(parameters.at("password") == "secret");
    REQUIRE(parameters.at("dbname") == "bookings");
    REQUIRE(parameters.at("connect_timeout") == "3");
}

TEST_CASE("PostgresProbe reports an unreachable server as not ready", "[db][postgres]") {
    core::ConnectionSettings settings;
    settings.host = "127.0.0.1";
    settings.port = reservePort();
    settings.connectTimeoutSeconds = 2;

    PostgresProbe probe(settings);
    auto result = probe.probe();

    REQUIRE_FALSE(result.ready);
    REQUIRE_FALSE(result.message.empty());
    REQUIRE(result.message.back() != '\n');
}

TEST_CASE("makeReadinessProbe picks the probe for the driver", "[db][probe]") {
    core::ConnectionSettings settings;
    REQUIRE(dynamic_cast<PostgresProbe*>(makeReadinessProbe(settings).get()) != nullptr);

    settings.driver = core::DbDriver::Sqlite;
    REQUIRE(dynamic_cast<SqliteProbe*>(makeReadinessProbe(settings).get()) != nullptr);

    settings.driver = core::DbDriver::Tcp;
    REQUIRE(dynamic_cast<net::TcpProbe*>(makeReadinessProbe(settings).get()) != nullptr);
}

}  // namespace bootgate::entrypoint::db
