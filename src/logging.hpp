#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace logging {

enum class LEVEL {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR
};

void setLevel(LEVEL level);
LEVEL getLevel();

// Throws std::runtime_error on an unknown level name
LEVEL levelFromString(std::string_view text);

// Writes "[TAG] message" as a single line; errors go to stderr
void write(std::string_view tag, LEVEL level, const std::string &message);

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
  if (getLevel() <= LEVEL::DEBUG) {
    write("DEBUG", LEVEL::DEBUG, std::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
  if (getLevel() <= LEVEL::INFO) {
    write("INFO", LEVEL::INFO, std::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
  if (getLevel() <= LEVEL::WARN) {
    write("WARN", LEVEL::WARN, std::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
  write("ERROR", LEVEL::ERROR, std::format(fmt, std::forward<Args>(args)...));
}

}
