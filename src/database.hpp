#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace database {

struct Connection;

//Database specific
std::unique_ptr<Connection, void(*)(Connection*)>
getConnection(const std::string &path, bool transactional = false);

std::optional<UNEXPECTED_CODE>
run_stmt(Connection*, const char *);

//Model operations

std::expected<std::vector<models::Restaurant>, UNEXPECTED_CODE>
getRestaurantsByCity(Connection* connection, std::string_view city, int limit);

std::expected<std::vector<models::Restaurant>, UNEXPECTED_CODE>
findRestaurants(Connection* connection, const models::RestaurantQuery &query);

std::expected<models::Location, UNEXPECTED_CODE>
getCityLocation(Connection* connection, std::string_view city);

std::expected<models::Location, UNEXPECTED_CODE>
getZoneLocation(Connection* connection, std::string_view city, std::string_view zone);
}
