#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "logging.hpp"

namespace config {

struct Config {
  std::string host = "0.0.0.0";
  std::uint16_t port = 9999;
  std::size_t threads = 4;
  std::string databasePath = "restaurantes.db";
  std::string initSqlPath = "init.sql";
  int maxResults = 10;
  std::chrono::seconds cacheTtl{0};
  std::size_t cacheSize = 10000;
  logging::LEVEL logLevel = logging::LEVEL::INFO;

  // Defaults, then environment, then "--flag value" / "--flag=value" arguments.
  // Throws std::runtime_error on invalid values.
  static Config fromArgs(int argc, char **argv);
};

}
