#include "Config.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bootgate/core/CommandLine.h"
#include "bootgate/core/Serialization.h"
#include "bootgate/core/Validation.h"

namespace bootgate::entrypoint {

namespace {

constexpr const char* kRedacted = "********";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

int parseInteger(const std::string& value, const std::string& name, int minimum, int maximum) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < minimum || parsed > maximum) {
            throw std::invalid_argument("out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + name + ": " + value);
    }
}

int parsePort(const std::string& value, const std::string& name) { return parseInteger(value, name, 1, 65535); }

double parseMultiplier(const std::string& value, const std::string& name) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed < 1.0) {
            throw std::invalid_argument("out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + name + ": " + value);
    }
}

bool parseFlag(const std::string& value, const std::string& name) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    throw std::invalid_argument("Invalid value for " + name + ": " + value);
}

core::DbDriver parseDriver(const std::string& value, const std::string& name) {
    core::DbDriver driver{};
    if (!core::fromString(value, driver)) {
        throw std::invalid_argument("Invalid value for " + name + ": " + value);
    }
    return driver;
}

core::HandoffMode parseHandoff(const std::string& value, const std::string& name) {
    core::HandoffMode mode{};
    if (!core::fromString(value, mode)) {
        throw std::invalid_argument("Invalid value for " + name + ": " + value);
    }
    return mode;
}

core::RetryPolicy withInterval(const core::RetryPolicy& policy, int intervalMs) {
    return core::RetryPolicy(std::chrono::milliseconds(intervalMs), policy.getMultiplier(), policy.getMaxInterval(),
                             policy.getMaxAttempts());
}

core::RetryPolicy withMultiplier(const core::RetryPolicy& policy, double multiplier) {
    return core::RetryPolicy(policy.getInitialInterval(), multiplier, policy.getMaxInterval(),
                             policy.getMaxAttempts());
}

core::RetryPolicy withMaxInterval(const core::RetryPolicy& policy, int maxIntervalMs) {
    return core::RetryPolicy(policy.getInitialInterval(), policy.getMultiplier(),
                             std::chrono::milliseconds(maxIntervalMs), policy.getMaxAttempts());
}

core::RetryPolicy withMaxAttempts(const core::RetryPolicy& policy, int maxAttempts) {
    return core::RetryPolicy(policy.getInitialInterval(), policy.getMultiplier(), policy.getMaxInterval(),
                             maxAttempts);
}

struct ParsedArguments {
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> command;
};

bool isFlagOption(const std::string& name) {
    return name == "--help" || name == "-h" || name == "--verbose" || name == "--print-config" ||
           name == "--no-migrate" || name == "--no-seed";
}

bool isValueOption(const std::string& name) {
    static const char* const kValueOptions[] = {
        "--config",           "--db-driver",   "--db-host",         "--db-port",      "--db-user",
        "--db-password",      "--db-name",     "--db-path",         "--connect-timeout",
        "--retry-interval-ms", "--backoff",    "--max-interval-ms", "--max-attempts", "--migrate-cmd",
        "--seed-cmd",         "--handoff"};
    for (const char* option : kValueOptions) {
        if (name == option) {
            return true;
        }
    }
    return false;
}

// Splits argv into options ("--name value" and "--name=value" forms) and the trailing command.
ParsedArguments splitArguments(int argc, char* argv[]) {
    ParsedArguments parsed;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--") {
            ++i;
            break;
        }
        if (!startsWith(arg, "--") && arg != "-h") {
            break;
        }

        if (isFlagOption(arg)) {
            parsed.options.emplace_back(arg, "");
            continue;
        }

        const auto equals = arg.find('=');
        if (equals != std::string::npos && isValueOption(arg.substr(0, equals))) {
            parsed.options.emplace_back(arg.substr(0, equals), arg.substr(equals + 1));
        } else if (isValueOption(arg)) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            parsed.options.emplace_back(arg, argv[++i]);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    parsed.command.assign(argv + i, argv + argc);
    return parsed;
}

std::vector<std::string> commandFromJson(const nlohmann::json& j, const std::string& key) {
    if (j.is_string()) {
        return core::splitCommandLine(j.get<std::string>());
    }
    if (j.is_array()) {
        std::vector<std::string> argv;
        for (const auto& word : j) {
            if (!word.is_string()) {
                throw std::runtime_error("Entries in '" + key + "' must be strings");
            }
            argv.push_back(word.get<std::string>());
        }
        return argv;
    }
    throw std::runtime_error("Field '" + key + "' must be a string or an array of strings");
}

void applyEnvironment(EntrypointConfig& config, const EnvironmentLookup& env) {
    // Empty values count as unset, except for the step commands where empty disables the step.
    auto lookup = [&](const std::string& name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    auto& connection = config.connection;
    if (auto value = lookup("DB_DRIVER")) {
        connection.driver = parseDriver(*value, "DB_DRIVER");
    }
    if (auto value = lookup("DB_HOST")) {
        connection.host = *value;
    }
    if (auto value = lookup("DB_PORT")) {
        connection.port = parsePort(*value, "DB_PORT");
    }
    if (auto value = lookup("POSTGRES_USER")) {
        connection.user = *value;
    }
    if (auto value = lookup("POSTGRES_PASSWORD")) {
        connection.password = *value;
    }
    if (auto value = lookup("POSTGRES_DB")) {
        connection.database = *value;
    }
    if (auto value = lookup("DB_PATH")) {
        connection.sqlitePath = *value;
    }
    if (auto value = lookup("DB_CONNECT_TIMEOUT")) {
        connection.connectTimeoutSeconds = parseInteger(*value, "DB_CONNECT_TIMEOUT", 0, 3600);
    }

    if (auto value = lookup("ENTRYPOINT_RETRY_INTERVAL_MS")) {
        config.retry = withInterval(config.retry, parseInteger(*value, "ENTRYPOINT_RETRY_INTERVAL_MS", 1, 86400000));
    }
    if (auto value = lookup("ENTRYPOINT_BACKOFF_MULTIPLIER")) {
        config.retry = withMultiplier(config.retry, parseMultiplier(*value, "ENTRYPOINT_BACKOFF_MULTIPLIER"));
    }
    if (auto value = lookup("ENTRYPOINT_MAX_INTERVAL_MS")) {
        config.retry = withMaxInterval(config.retry, parseInteger(*value, "ENTRYPOINT_MAX_INTERVAL_MS", 1, 86400000));
    }
    if (auto value = lookup("ENTRYPOINT_MAX_ATTEMPTS")) {
        config.retry = withMaxAttempts(config.retry, parseInteger(*value, "ENTRYPOINT_MAX_ATTEMPTS", 0, 1000000000));
    }

    if (auto value = env("ENTRYPOINT_MIGRATE_COMMAND")) {
        config.migrateCommand = core::splitCommandLine(*value);
    }
    if (auto value = env("ENTRYPOINT_SEED_COMMAND")) {
        config.seedCommand = core::splitCommandLine(*value);
    }
    if (auto value = lookup("ENTRYPOINT_HANDOFF")) {
        config.handoff = parseHandoff(*value, "ENTRYPOINT_HANDOFF");
    }
    if (auto value = lookup("ENTRYPOINT_VERBOSE")) {
        config.verbose = parseFlag(*value, "ENTRYPOINT_VERBOSE");
    }
}

void requireValue(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("Missing value for " + name);
    }
}

void applyOptions(EntrypointConfig& config, const ParsedArguments& parsed) {
    auto& connection = config.connection;

    for (const auto& [name, value] : parsed.options) {
        if (name == "--help" || name == "-h") {
            config.showHelp = true;
        } else if (name == "--verbose") {
            config.verbose = true;
        } else if (name == "--print-config") {
            config.printConfig = true;
        } else if (name == "--no-migrate") {
            config.migrateCommand.clear();
        } else if (name == "--no-seed") {
            config.seedCommand.clear();
        } else if (name == "--config") {
            requireValue(name, value);
            config.configFile = value;
        } else if (name == "--db-driver") {
            connection.driver = parseDriver(value, name);
        } else if (name == "--db-host") {
            requireValue(name, value);
            connection.host = value;
        } else if (name == "--db-port") {
            connection.port = parsePort(value, name);
        } else if (name == "--db-user") {
            connection.user = value;
        } else if (name == "--db-password") {
            connection.password = value;
        } else if (name == "--db-name") {
            connection.database = value;
        } else if (name == "--db-path") {
            connection.sqlitePath = value;
        } else if (name == "--connect-timeout") {
            connection.connectTimeoutSeconds = parseInteger(value, name, 0, 3600);
        } else if (name == "--retry-interval-ms") {
            config.retry = withInterval(config.retry, parseInteger(value, name, 1, 86400000));
        } else if (name == "--backoff") {
            config.retry = withMultiplier(config.retry, parseMultiplier(value, name));
        } else if (name == "--max-interval-ms") {
            config.retry = withMaxInterval(config.retry, parseInteger(value, name, 1, 86400000));
        } else if (name == "--max-attempts") {
            config.retry = withMaxAttempts(config.retry, parseInteger(value, name, 0, 1000000000));
        } else if (name == "--migrate-cmd") {
            config.migrateCommand = core::splitCommandLine(value);
        } else if (name == "--seed-cmd") {
            config.seedCommand = core::splitCommandLine(value);
        } else if (name == "--handoff") {
            config.handoff = parseHandoff(value, name);
        }
    }

    config.command = parsed.command;
}

}  // namespace

EnvironmentLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

void applyConfigFile(EntrypointConfig& config, const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + ex.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }

    for (const auto& item : j.items()) {
        const auto& key = item.key();
        const auto& value = item.value();
        if (key == "database") {
            core::from_json(value, config.connection);
        } else if (key == "retry") {
            core::from_json(value, config.retry);
        } else if (key == "migrateCommand") {
            config.migrateCommand = commandFromJson(value, key);
        } else if (key == "seedCommand") {
            config.seedCommand = commandFromJson(value, key);
        } else if (key == "handoff") {
            core::from_json(value, config.handoff);
        } else if (key == "verbose") {
            if (!value.is_boolean()) {
                throw std::runtime_error("Field 'verbose' must be a boolean");
            }
            config.verbose = value.get<bool>();
        } else {
            throw std::runtime_error("Unknown field in config file: " + key);
        }
    }
    config.configFile = path;
}

EntrypointConfig parseEntrypointConfig(int argc, char* argv[], const EnvironmentLookup& env) {
    EntrypointConfig config;

    const auto parsed = splitArguments(argc, argv);

    // Help never depends on the file or the environment being valid.
    for (const auto& option : parsed.options) {
        if (option.first == "--help" || option.first == "-h") {
            config.showHelp = true;
            return config;
        }
    }

    std::string configFile;
    for (const auto& [name, value] : parsed.options) {
        if (name == "--config") {
            configFile = value;
        }
    }
    if (configFile.empty()) {
        configFile = env("ENTRYPOINT_CONFIG").value_or("");
    }
    if (!configFile.empty()) {
        try {
            applyConfigFile(config, configFile);
        } catch (const std::runtime_error& ex) {
            throw std::invalid_argument(ex.what());
        }
    }

    applyEnvironment(config, env);
    applyOptions(config, parsed);

    std::string errorMessage;
    if (!core::validateConnectionSettings(config.connection, errorMessage) ||
        !core::validateRetryPolicy(config.retry, errorMessage)) {
        throw std::invalid_argument(errorMessage);
    }

    if (config.command.empty() && !config.printConfig) {
        throw std::invalid_argument("Missing application command");
    }

    return config;
}

nlohmann::json configToJson(const EntrypointConfig& config) {
    nlohmann::json connection = config.connection;
    connection["password"] = kRedacted;

    return nlohmann::json{{"database", connection},
                          {"retry", config.retry},
                          {"migrateCommand", config.migrateCommand},
                          {"seedCommand", config.seedCommand},
                          {"handoff", config.handoff},
                          {"verbose", config.verbose},
                          {"command", config.command}};
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " [options] [--] <command> [args...]\n"
           "\n"
           "Waits until the database accepts connections, runs the migrate and seed\n"
           "commands, then replaces itself with <command>.\n"
           "\n"
           "Options:\n"
           "  --db-driver <postgres|sqlite|tcp>  --db-host <host>  --db-port <port>\n"
           "  --db-user <user>  --db-password <password>  --db-name <name>  --db-path <file>\n"
           "  --connect-timeout <seconds>  --retry-interval-ms <ms>  --backoff <multiplier>\n"
           "  --max-interval-ms <ms>  --max-attempts <n>\n"
           "  --migrate-cmd <command>  --no-migrate  --seed-cmd <command>  --no-seed\n"
           "  --handoff <exec|spawn>  --config <file>  --verbose  --print-config  --help\n";
}

}  // namespace bootgate::entrypoint
