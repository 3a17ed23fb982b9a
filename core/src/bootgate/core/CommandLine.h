#pragma once

#include <string>
#include <vector>

namespace bootgate::core {

// Splits a configured command string into argv words without invoking a shell.
//
// Rules: unquoted whitespace separates words; single quotes preserve everything literally;
// double quotes preserve whitespace and accept \" and \\ escapes; a backslash outside quotes
// escapes the next character. Throws std::invalid_argument on an unterminated quote or a
// trailing backslash. An empty or blank string yields an empty vector.
std::vector<std::string> splitCommandLine(const std::string& command);

// Joins argv words for display, quoting words that contain whitespace or quotes.
std::string joinCommandLine(const std::vector<std::string>& argv);

}  // namespace bootgate::core
