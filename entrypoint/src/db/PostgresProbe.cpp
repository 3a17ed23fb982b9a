#include "db/PostgresProbe.h"

#include <libpq-fe.h>

#include <memory>
#include <utility>

namespace bootgate::entrypoint::db {

namespace {

struct PGconnDeleter {
    void operator()(PGconn* connection) const { PQfinish(connection); }
};

using PGconnPtr = std::unique_ptr<PGconn, PGconnDeleter>;

std::string trimTrailingWhitespace(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == ' ' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

}  // namespace

PostgresProbe::PostgresProbe(core::ConnectionSettings settings) : settings_(std::move(settings)) {}

std::vector<std::pair<std::string, std::string>> PostgresProbe::connectionParameters() const {
    return {{"host", settings_.host},
            {"port", std::to_string(settings_.port)},
            {"user", settings_.user},
            {"password", settings_.password},
            {"dbname", settings_.database},
            {"connect_timeout", std::to_string(settings_.connectTimeoutSeconds)},
            {"application_name", "bootgate-entrypoint"}};
}

ProbeResult PostgresProbe::probe() {
    const auto parameters = connectionParameters();

    std::vector<const char*> keywords;
    std::vector<const char*> values;
    keywords.reserve(parameters.size() + 1);
    values.reserve(parameters.size() + 1);
    for (const auto& [keyword, value] : parameters) {
        keywords.push_back(keyword.c_str());
        values.push_back(value.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    PGconnPtr connection(PQconnectdbParams(keywords.data(), values.data(), 0));
    if (!connection) {
        return {false, "out of memory allocating a libpq connection"};
    }

    if (PQstatus(connection.get()) != CONNECTION_OK) {
        return {false, trimTrailingWhitespace(PQerrorMessage(connection.get()))};
    }

    return {true, {}};
}

}  // namespace bootgate::entrypoint::db
