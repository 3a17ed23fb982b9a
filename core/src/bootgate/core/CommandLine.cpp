#include "bootgate/core/CommandLine.h"

#include <cctype>
#include <stdexcept>

namespace bootgate::core {
namespace {

enum class QuoteState { None, Single, Double };

bool isBlank(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool needsQuoting(const std::string& word) {
  if (word.empty()) {
    return true;
  }
  for (char c : word) {
    if (isBlank(c) || c == '\'' || c == '"' || c == '\\') {
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<std::string> splitCommandLine(const std::string& command) {
  std::vector<std::string> words;
  std::string current;
  bool inWord = false;
  QuoteState state = QuoteState::None;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char c = command[i];
    switch (state) {
      case QuoteState::Single:
        if (c == '\'') {
          state = QuoteState::None;
        } else {
          current.push_back(c);
        }
        break;

      case QuoteState::Double:
        if (c == '"') {
          state = QuoteState::None;
        } else if (c == '\\' && i + 1 < command.size() && (command[i + 1] == '"' || command[i + 1] == '\\')) {
          current.push_back(command[++i]);
        } else {
          current.push_back(c);
        }
        break;

      case QuoteState::None:
        if (isBlank(c)) {
          if (inWord) {
            words.push_back(current);
            current.clear();
            inWord = false;
          }
        } else if (c == '\'') {
          state = QuoteState::Single;
          inWord = true;
        } else if (c == '"') {
          state = QuoteState::Double;
          inWord = true;
        } else if (c == '\\') {
          if (i + 1 >= command.size()) {
            throw std::invalid_argument("Trailing backslash in command: " + command);
          }
          current.push_back(command[++i]);
          inWord = true;
        } else {
          current.push_back(c);
          inWord = true;
        }
        break;
    }
  }

  if (state != QuoteState::None) {
    throw std::invalid_argument("Unterminated quote in command: " + command);
  }
  if (inWord) {
    words.push_back(current);
  }
  return words;
}

std::string joinCommandLine(const std::vector<std::string>& argv) {
  std::string result;
  for (const auto& word : argv) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    if (!needsQuoting(word)) {
      result += word;
      continue;
    }
    result.push_back('\'');
    for (char c : word) {
      if (c == '\'') {
        result += "'\\''";
      } else {
        result.push_back(c);
      }
    }
    result.push_back('\'');
  }
  return result;
}

}  // namespace bootgate::core
