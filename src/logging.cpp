#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace logging {

namespace {
  std::atomic<LEVEL> currentLevel{LEVEL::INFO};
  std::mutex outputMutex;
}

void setLevel(LEVEL level) {
  currentLevel.store(level);
}

LEVEL getLevel() {
  return currentLevel.load();
}

LEVEL levelFromString(std::string_view text) {
  std::string normalized{text};
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "debug") return LEVEL::DEBUG;
  if (normalized == "info") return LEVEL::INFO;
  if (normalized == "warn" || normalized == "warning") return LEVEL::WARN;
  if (normalized == "error") return LEVEL::ERROR;

  throw std::runtime_error("Nivel de log inválido: " + normalized);
}

void write(std::string_view tag, LEVEL level, const std::string &message) {
  std::lock_guard<std::mutex> lock(outputMutex);

  auto &stream = level == LEVEL::ERROR ? std::cerr : std::cout;
  stream << "[" << tag << "] " << message << std::endl;
}

}
