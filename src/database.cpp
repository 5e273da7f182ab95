#include "database.hpp"
#include "logging.hpp"
#include "sqlite3.h"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace database {

struct Connection {
  sqlite3 *db = nullptr;
  sqlite3_stmt* stmt = nullptr;
  const bool transactional;
  int rc = SQLITE_OK;
  bool failed = false;

  Connection(const std::string &path, bool transactional): transactional(transactional) {
    rc = sqlite3_open(path.c_str(), &db);

    if(rc != SQLITE_OK) {
      sqlite3_close(db);
      throw std::runtime_error("DATABASE couldn't be opened: " + path);
    }

    sqlite3_busy_timeout(db, 1000);

    if(transactional) {
      do {
        rc = sqlite3_exec(db, "BEGIN IMMEDIATE", 0, 0, 0);
      }
      while(rc == SQLITE_BUSY);
    }

    if(rc != SQLITE_OK) {
      sqlite3_close(db);
      throw std::runtime_error("DATABASE transaction couldn't be started: " + path);
    }
  }

  template<typename Functor>
  void prepare(Functor functor) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }
    command(functor);
  }

  template<typename Functor>
  void command(Functor functor) {

    if(rc == SQLITE_DONE
        || rc == SQLITE_ROW
        || rc == SQLITE_OK) {

      do {
        rc = functor();
      } while(rc == SQLITE_BUSY);

      if(rc != SQLITE_DONE && rc != SQLITE_ROW && rc != SQLITE_OK) {
        failed = true;
        logging::error("[SQLITE3_ERROR] {}", sqlite3_errmsg(db));
      }
    }
  }

  template<typename... Functors>
  void command(Functors&&... functors) {
    ([&]{
     command(functors);
    } (), ...);
  }
};

void deleteConnection(Connection* connection) {
  const int finalizeRc = sqlite3_finalize(connection->stmt);

  if(connection->transactional) {
    const bool commit = finalizeRc == SQLITE_OK && !connection->failed;
    const int endRc = sqlite3_exec(connection->db, commit ? "COMMIT" : "ROLLBACK", 0, 0, 0);

    if(endRc != SQLITE_OK) {
      logging::error("[SQLITE3_ERROR END] {}", sqlite3_errmsg(connection->db));
    }
  }

  if(sqlite3_close(connection->db) != SQLITE_OK) {
    logging::error("[SQLITE3_ERROR DELETE] {}", sqlite3_errmsg(connection->db));
  }

  delete connection;
}

std::unique_ptr<Connection, void(*)(Connection*)>
getConnection(const std::string &path, bool transactional) {
  return std::unique_ptr<Connection, void (*)(Connection *)>(new Connection(path, transactional), deleteConnection);
}

std::optional<UNEXPECTED_CODE>
run_stmt(Connection *connection, const char *sql) {
  char *zErrMsg = 0;

  int rc = sqlite3_exec(connection->db, sql, nullptr, 0, &zErrMsg);

  if (rc != SQLITE_OK) {
    logging::error("[SQLITE3_ERROR] {}", zErrMsg ? zErrMsg : sqlite3_errmsg(connection->db));
    sqlite3_free(zErrMsg);
    connection->failed = true;
    return UNEXPECTED_CODE::UNKNOWN;
  }

  return std::nullopt;
}

namespace {

using Parameter = std::variant<std::string, double, int>;

constexpr const char *RESTAURANT_COLUMNS = R"(
  SELECT id, titulo, estrellas, rango_de_precios, url_maps,
         bh_message, url, categorias, lat, lng, nbh2
  FROM restaurantes
)";

int bindParameter(sqlite3_stmt *stmt, int index, const Parameter &parameter) {
  return std::visit([&](const auto &value) {
    using T = std::decay_t<decltype(value)>;

    if constexpr (std::is_same_v<T, std::string>) {
      return sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    } else if constexpr (std::is_same_v<T, double>) {
      return sqlite3_bind_double(stmt, index, value);
    } else {
      return sqlite3_bind_int(stmt, index, value);
    }
  }, parameter);
}

std::string columnText(sqlite3_stmt *stmt, int column) {
  auto text = sqlite3_column_text(stmt, column);
  return text ? std::string{reinterpret_cast<const char *>(text)} : std::string{};
}

std::optional<std::string> optionalText(sqlite3_stmt *stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return columnText(stmt, column);
}

models::Restaurant readRestaurant(sqlite3_stmt *stmt) {
  models::Restaurant restaurant;

  restaurant.id = sqlite3_column_int64(stmt, 0);
  restaurant.titulo = columnText(stmt, 1);
  restaurant.estrellas = sqlite3_column_double(stmt, 2);
  restaurant.rango_de_precios = columnText(stmt, 3);
  restaurant.url_maps = columnText(stmt, 4);
  restaurant.bh_message = optionalText(stmt, 5);
  restaurant.url = optionalText(stmt, 6);
  restaurant.categorias = columnText(stmt, 7);
  restaurant.location.lat = sqlite3_column_double(stmt, 8);
  restaurant.location.lng = sqlite3_column_double(stmt, 9);
  restaurant.nbh2 = sqlite3_column_double(stmt, 10);

  return restaurant;
}

// " AND (clause OR clause ...)" with one bound value per clause
void appendAnyOf(std::string &sql, std::vector<Parameter> &parameters,
                 const std::vector<std::string> &values, const char *clause) {
  if (values.empty()) {
    return;
  }

  sql += " AND (";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      sql += " OR ";
    }
    sql += clause;
    parameters.emplace_back(values[i]);
  }
  sql += ")";
}

std::expected<std::vector<models::Restaurant>, UNEXPECTED_CODE>
queryRestaurants(Connection *connection, const std::string &sql, const std::vector<Parameter> &parameters) {

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql.c_str(), -1, &(connection->stmt), nullptr);
  });

  for (std::size_t i = 0; i < parameters.size(); ++i) {
    connection->command([&]() {
      return bindParameter(connection->stmt, static_cast<int>(i + 1), parameters[i]);
    });
  }

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  std::vector<models::Restaurant> restaurants;

  while(connection->rc == SQLITE_ROW) {
    restaurants.push_back(readRestaurant(connection->stmt));

    connection->command([&]() {
      return sqlite3_step(connection->stmt);
    });
  }

  if(connection->rc == SQLITE_DONE) {
    return restaurants;
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

std::expected<models::Location, UNEXPECTED_CODE>
queryLocation(Connection *connection, const char *sql, const std::vector<Parameter> &parameters) {

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  for (std::size_t i = 0; i < parameters.size(); ++i) {
    connection->command([&]() {
      return bindParameter(connection->stmt, static_cast<int>(i + 1), parameters[i]);
    });
  }

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  if (connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if (connection->rc == SQLITE_ROW) {
    return models::Location{
      sqlite3_column_double(connection->stmt, 0),
      sqlite3_column_double(connection->stmt, 1)
    };
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

}

std::expected<std::vector<models::Restaurant>, UNEXPECTED_CODE>
getRestaurantsByCity(Connection* connection, std::string_view city, int limit) {
  models::RestaurantQuery query;
  query.city = std::string{city};
  query.limit = limit;

  return findRestaurants(connection, query);
}

std::expected<std::vector<models::Restaurant>, UNEXPECTED_CODE>
findRestaurants(Connection* connection, const models::RestaurantQuery &query) {
  std::string sql{RESTAURANT_COLUMNS};
  std::vector<Parameter> parameters;

  sql += " WHERE ciudad = ? COLLATE NOCASE";
  parameters.emplace_back(query.city);

  // Exact match: "$" does not select "$$"
  appendAnyOf(sql, parameters, query.price_ranges, "rango_de_precios = ?");
  appendAnyOf(sql, parameters, query.cuisines, "instr(lower(categorias), lower(?)) > 0");

  if (query.diet) {
    appendAnyOf(sql, parameters, {*query.diet}, "instr(lower(categorias), lower(?)) > 0");
  }

  appendAnyOf(sql, parameters, query.dishes, "instr(lower(google_reviews), lower(?)) > 0");

  if (query.box) {
    sql += " AND lat >= ? AND lat <= ? AND lng >= ? AND lng <= ?";
    parameters.emplace_back(query.box->lat_min);
    parameters.emplace_back(query.box->lat_max);
    parameters.emplace_back(query.box->lon_min);
    parameters.emplace_back(query.box->lon_max);
  }

  sql += " ORDER BY nbh2 DESC, titulo ASC LIMIT ?";
  parameters.emplace_back(query.limit);

  return queryRestaurants(connection, sql, parameters);
}

std::expected<models::Location, UNEXPECTED_CODE>
getCityLocation(Connection* connection, std::string_view city) {

  auto sql = R"(
    SELECT lat, lng
    FROM ciudades
    WHERE nombre = ? COLLATE NOCASE
    LIMIT 1
  )";

  return queryLocation(connection, sql, {std::string{city}});
}

std::expected<models::Location, UNEXPECTED_CODE>
getZoneLocation(Connection* connection, std::string_view city, std::string_view zone) {

  auto sql = R"(
    SELECT lat, lng
    FROM zonas
    WHERE ciudad = ? COLLATE NOCASE AND nombre = ? COLLATE NOCASE
    LIMIT 1
  )";

  return queryLocation(connection, sql, {std::string{city}, std::string{zone}});
}

}
