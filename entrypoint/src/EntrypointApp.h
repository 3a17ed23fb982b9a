#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Config.h"
#include "Log.h"
#include "ReadinessGate.h"
#include "db/ReadinessProbe.h"
#include "process/CommandRunner.h"
#include "process/ProcessError.h"
#include "process/ProcessHandoff.h"

namespace bootgate::entrypoint {

// A migrate or seed command that exited non-zero. Carries the command's exit code.
class StepFailed : public process::ProcessError {
public:
    StepFailed(const std::string& step, const std::vector<std::string>& command, int exitCode);

    const std::string& step() const { return step_; }

private:
    std::string step_;
};

// Runs the startup sequence: readiness gate, migration, seed, handoff.
class EntrypointApp {
public:
    struct Collaborators {
        std::unique_ptr<db::ReadinessProbe> probe;
        std::unique_ptr<process::CommandRunner> runner;
        std::unique_ptr<process::ProcessHandoff> handoff;
        Sleeper sleeper;
    };

    // Uses the probe for the configured driver, real child processes and the configured handoff.
    EntrypointApp(EntrypointConfig config, Logger& logger);
    EntrypointApp(EntrypointConfig config, Logger& logger, Collaborators collaborators);
    ~EntrypointApp();

    // Returns the process exit code. With exec handoff a successful run does not return.
    int run();

    void waitForDatabase();
    void runMigrations();
    void runSeed();
    int handOff();

private:
    void runStep(const std::string& step, const std::vector<std::string>& command);

    EntrypointConfig config_;
    Logger& logger_;
    Collaborators collaborators_;
};

}  // namespace bootgate::entrypoint
