#include "EntrypointApp.h"

#include <stdexcept>
#include <utility>

#include "bootgate/core/CommandLine.h"

namespace bootgate::entrypoint {

namespace {

std::unique_ptr<process::ProcessHandoff> makeHandoff(core::HandoffMode mode) {
    if (mode == core::HandoffMode::Spawn) {
        return std::make_unique<process::SpawnHandoff>();
    }
    return std::make_unique<process::ExecHandoff>();
}

EntrypointApp::Collaborators defaultCollaborators(const EntrypointConfig& config) {
    EntrypointApp::Collaborators collaborators;
    collaborators.probe = db::makeReadinessProbe(config.connection);
    collaborators.runner = std::make_unique<process::ChildProcessRunner>();
    collaborators.handoff = makeHandoff(config.handoff);
    collaborators.sleeper = threadSleeper();
    return collaborators;
}

}  // namespace

StepFailed::StepFailed(const std::string& step, const std::vector<std::string>& command, int exitCode)
    : process::ProcessError(step + " command failed with exit code " + std::to_string(exitCode) + ": " +
                                core::joinCommandLine(command),
                            exitCode),
      step_(step) {}

EntrypointApp::EntrypointApp(EntrypointConfig config, Logger& logger)
    : EntrypointApp(config, logger, defaultCollaborators(config)) {}

EntrypointApp::EntrypointApp(EntrypointConfig config, Logger& logger, Collaborators collaborators)
    : config_(std::move(config)), logger_(logger), collaborators_(std::move(collaborators)) {
    if (!collaborators_.probe || !collaborators_.runner || !collaborators_.handoff) {
        throw std::invalid_argument("EntrypointApp requires a probe, a runner and a handoff");
    }
    if (!collaborators_.sleeper) {
        collaborators_.sleeper = threadSleeper();
    }
}

EntrypointApp::~EntrypointApp() = default;

int EntrypointApp::run() {
    try {
        logger_.debug("Database endpoint " + core::describeEndpoint(config_.connection));
        waitForDatabase();
        runMigrations();
        runSeed();
        return handOff();
    } catch (const process::ProcessError& ex) {
        logger_.error(ex.what());
        return ex.exitCode();
    } catch (const std::exception& ex) {
        logger_.error(ex.what());
        return 1;
    }
}

void EntrypointApp::waitForDatabase() {
    ReadinessGate gate(*collaborators_.probe, config_.retry, core::targetName(config_.connection), logger_,
                       collaborators_.sleeper);
    gate.waitUntilReady();
}

void EntrypointApp::runMigrations() { runStep("Migration", config_.migrateCommand); }

void EntrypointApp::runSeed() { runStep("Seed", config_.seedCommand); }

int EntrypointApp::handOff() {
    logger_.status("Starting application...");
    logger_.debug("Handing off to " + core::joinCommandLine(config_.command) + " (" +
                  core::toString(config_.handoff) + ")");
    return collaborators_.handoff->handoff(config_.command);
}

void EntrypointApp::runStep(const std::string& step, const std::vector<std::string>& command) {
    if (command.empty()) {
        logger_.debug(step + " step disabled");
        return;
    }

    logger_.debug("Running " + core::joinCommandLine(command));
    const int exitCode = collaborators_.runner->run(command);
    if (exitCode != 0) {
        throw StepFailed(step, command, exitCode);
    }
}

}  // namespace bootgate::entrypoint
