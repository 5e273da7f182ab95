#include "config.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace config {

namespace {

constexpr std::size_t MAX_CACHE_TTL_SECONDS = 365U * 24U * 60U * 60U;

std::size_t parseCount(const std::string &value, const std::string &label) {
  try {
    std::size_t consumed = 0;
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
      throw std::invalid_argument("not a number");
    }
    const auto parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::exception &) {
    throw std::runtime_error("Valor inválido para " + label + ": " + value);
  }
}

std::uint16_t parsePort(const std::string &value, const std::string &label) {
  const auto port = parseCount(value, label);
  if (port == 0U || port > 65535U) {
    throw std::runtime_error("Puerto inválido: " + value);
  }
  return static_cast<std::uint16_t>(port);
}

// At most one year
std::chrono::seconds parseCacheTtl(const std::string &value, const std::string &label) {
  const auto ttl = parseCount(value, label);
  if (ttl > MAX_CACHE_TTL_SECONDS) {
    throw std::runtime_error("Valor inválido para " + label + " (máximo " + std::to_string(MAX_CACHE_TTL_SECONDS) + "): " + value);
  }
  return std::chrono::seconds{static_cast<long long>(ttl)};
}

std::size_t parsePositive(const std::string &value, const std::string &label) {
  const auto parsed = parseCount(value, label);
  if (parsed == 0U) {
    throw std::runtime_error("Valor inválido para " + label + ": " + value);
  }
  return parsed;
}

int parseMaxResults(const std::string &value, const std::string &label) {
  const auto parsed = parsePositive(value, label);
  if (parsed > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Valor inválido para " + label + ": " + value);
  }
  return static_cast<int>(parsed);
}

std::string valueFromArgs(int argc, char **argv, const std::string &key) {
  const std::string withEquals = key + '=';
  for (int i = 1; i < argc; ++i) {
    std::string arg{argv[i]};
    if (arg == key && i + 1 < argc) {
      return argv[i + 1];
    }
    if (arg.rfind(withEquals, 0) == 0) {
      return arg.substr(withEquals.size());
    }
  }
  return {};
}

std::string valueFromEnv(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string{value} : std::string{};
}

// Applies the environment variable first and the flag second
template<typename Apply>
void applySetting(int argc, char **argv, const char *env, const std::string &flag, Apply apply) {
  if (auto value = valueFromEnv(env); !value.empty()) {
    apply(value, std::string{env});
  }
  if (auto value = valueFromArgs(argc, argv, flag); !value.empty()) {
    apply(value, flag);
  }
}

}

Config Config::fromArgs(int argc, char **argv) {
  Config config{};

  applySetting(argc, argv, "BISTROHUNTER_HOST", "--host", [&](const std::string &value, const std::string &) {
    config.host = value;
  });
  applySetting(argc, argv, "PORT", "--port", [&](const std::string &value, const std::string &label) {
    config.port = parsePort(value, label);
  });
  applySetting(argc, argv, "BISTROHUNTER_THREADS", "--threads", [&](const std::string &value, const std::string &label) {
    config.threads = parsePositive(value, label);
  });
  applySetting(argc, argv, "BISTROHUNTER_DATABASE", "--database", [&](const std::string &value, const std::string &) {
    config.databasePath = value;
  });
  applySetting(argc, argv, "BISTROHUNTER_INIT_SQL", "--init-sql", [&](const std::string &value, const std::string &) {
    config.initSqlPath = value;
  });
  applySetting(argc, argv, "BISTROHUNTER_MAX_RESULTS", "--max-results", [&](const std::string &value, const std::string &label) {
    config.maxResults = parseMaxResults(value, label);
  });
  applySetting(argc, argv, "BISTROHUNTER_CACHE_TTL", "--cache-ttl", [&](const std::string &value, const std::string &label) {
    config.cacheTtl = parseCacheTtl(value, label);
  });
  applySetting(argc, argv, "BISTROHUNTER_CACHE_SIZE", "--cache-size", [&](const std::string &value, const std::string &label) {
    config.cacheSize = parseCount(value, label);
  });
  applySetting(argc, argv, "LOG_LEVEL", "--log-level", [&](const std::string &value, const std::string &) {
    config.logLevel = logging::levelFromString(value);
  });

  return config;
}

}
