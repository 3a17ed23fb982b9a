#pragma once

#include <iostream>
#include <string>

namespace bootgate::entrypoint {

// Console output of the entrypoint. Status lines always go to stdout, diagnostics only in verbose
// mode. Every line is flushed so nothing is lost when the process image is replaced.
class Logger {
public:
    explicit Logger(bool verbose = false, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void status(const std::string& message);
    void debug(const std::string& message);
    void error(const std::string& message);

    bool isVerbose() const { return verbose_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace bootgate::entrypoint
