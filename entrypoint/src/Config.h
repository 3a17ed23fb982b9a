#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bootgate/core/ConnectionSettings.h"
#include "bootgate/core/Enums.h"
#include "bootgate/core/RetryPolicy.h"

namespace bootgate::entrypoint {

struct EntrypointConfig {
    core::ConnectionSettings connection;
    core::RetryPolicy retry;
    std::vector<std::string> migrateCommand{"alembic", "upgrade", "head"};
    std::vector<std::string> seedCommand{"python", "fill_data.py"};
    core::HandoffMode handoff{core::HandoffMode::Exec};
    bool verbose{false};
    bool showHelp{false};
    bool printConfig{false};
    std::string configFile;
    // Application command handed off at the end, exactly as given.
    std::vector<std::string> command;
};

// Returns the value of an environment variable, or nullopt when it is not set.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvironmentLookup processEnvironment();

// Builds the effective configuration. Sources, lowest to highest precedence: built-in defaults,
// the JSON config file (ENTRYPOINT_CONFIG or --config), environment variables, options.
//
// Options:
//   --db-driver <postgres|sqlite|tcp>   DB_DRIVER
//   --db-host <host>                    DB_HOST                       (default "db")
//   --db-port <port>                    DB_PORT                       (default 5432)
//   --db-user <user>                    POSTGRES_USER                 (default "user")
//   --db-password <password>            POSTGRES_PASSWORD             (default "password")
//   --db-name <name>                    POSTGRES_DB                   (default "flight_booking")
//   --db-path <file>                    DB_PATH                       (sqlite driver)
//   --connect-timeout <seconds>         DB_CONNECT_TIMEOUT            (default 5)
//   --retry-interval-ms <ms>            ENTRYPOINT_RETRY_INTERVAL_MS  (default 2000)
//   --backoff <multiplier>              ENTRYPOINT_BACKOFF_MULTIPLIER (default 1.0)
//   --max-interval-ms <ms>              ENTRYPOINT_MAX_INTERVAL_MS    (default 30000)
//   --max-attempts <n>                  ENTRYPOINT_MAX_ATTEMPTS       (default 0, unbounded)
//   --migrate-cmd <command>, --no-migrate   ENTRYPOINT_MIGRATE_COMMAND
//   --seed-cmd <command>, --no-seed         ENTRYPOINT_SEED_COMMAND
//   --handoff <exec|spawn>              ENTRYPOINT_HANDOFF            (default exec)
//   --config <file>                     ENTRYPOINT_CONFIG
//   --verbose                           ENTRYPOINT_VERBOSE
//   --print-config, --help
//
// Every option also accepts the --name=value form. Option parsing stops at "--" or at the first
// argument that is not an option; the remaining arguments form the application command.
//
// Throws std::invalid_argument for malformed values, unknown options and a missing command.
EntrypointConfig parseEntrypointConfig(int argc, char* argv[], const EnvironmentLookup& env = processEnvironment());

// Overlays the settings of a JSON config file onto config. Throws std::runtime_error if the file
// cannot be read or does not match the expected layout.
void applyConfigFile(EntrypointConfig& config, const std::string& path);

// Effective configuration as JSON with the password redacted.
nlohmann::json configToJson(const EntrypointConfig& config);

std::string usage(const std::string& program);

}  // namespace bootgate::entrypoint
