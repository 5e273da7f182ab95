#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "httplib.h"
#include "config.hpp"
#include "database.hpp"
#include "logging.hpp"
#include "routes.hpp"
#include "search.hpp"

#define PROJECT_NAME "bistrohunter"

void initDatabase(const config::Config &config) {
    namespace fs = std::filesystem;

    if (!fs::exists(config.initSqlPath)) {
      logging::warn("No se encontró {}, se usa la base de datos existente", config.initSqlPath);
      return;
    }

    std::fstream s{config.initSqlPath, s.in};

    if(!s.is_open()) {
      throw std::runtime_error("No se pudo leer " + config.initSqlPath);
    }

    auto connection = database::getConnection(config.databasePath, true);

    std::stringstream sql;

    sql << s.rdbuf();

    if (database::run_stmt(connection.get(), sql.str().c_str())) {
      throw std::runtime_error("No se pudo inicializar la base de datos con " + config.initSqlPath);
    }

    logging::info("Base de datos {} inicializada con {}", config.databasePath, config.initSqlPath);
}

int
main(int argc, char **argv) {
  try {
    const auto config = config::Config::fromArgs(argc, argv);
    logging::setLevel(config.logLevel);

    initDatabase(config);

    search::Options options;
    options.maxResults = config.maxResults;
    options.cacheTtl = config.cacheTtl;
    options.cacheSize = config.cacheSize;

    const search::Service service{config.databasePath, options};

    // HTTP
    httplib::Server svr;

    const auto threads = config.threads;
    svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    routes::registerRoutes(svr, service);

    logging::info("{} escuchando en {}:{}", PROJECT_NAME, config.host, config.port);

    if (!svr.listen(config.host, config.port)) {
      logging::error("No se pudo escuchar en {}:{}", config.host, config.port);
      return 1;
    }
  } catch (const std::runtime_error &e) {
    logging::error("{}", e.what());
    return 1;
  }

  return 0;
}
