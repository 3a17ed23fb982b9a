#pragma once

#include <string>
#include <vector>

namespace bootgate::entrypoint::process {

// Null-terminated argv view over words. The strings must outlive the result.
inline std::vector<char*> makeArgv(const std::vector<std::string>& words) {
    std::vector<char*> argv;
    argv.reserve(words.size() + 1);
    for (const auto& word : words) {
        argv.push_back(const_cast<char*>(word.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

}  // namespace bootgate::entrypoint::process
