#include "Log.h"

namespace bootgate::entrypoint {

Logger::Logger(bool verbose, std::ostream& out, std::ostream& err) : verbose_(verbose), out_(out), err_(err) {}

void Logger::status(const std::string& message) { out_ << message << std::endl; }

void Logger::debug(const std::string& message) {
    if (verbose_) {
        out_ << "[entrypoint] " << message << std::endl;
    }
}

void Logger::error(const std::string& message) { err_ << "Error: " << message << std::endl; }

}  // namespace bootgate::entrypoint
