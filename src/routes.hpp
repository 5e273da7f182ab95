#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "httplib.h"
#include "models.hpp"
#include "search.hpp"
#include "unexpected_codes.hpp"

namespace routes {

void
index(const httplib::Request &req, httplib::Response &res);

// GET /restaurantes/:city
void
restaurantsByCity(const search::Service &service, const httplib::Request &req, httplib::Response &res);

// GET /api/getRestaurants?city=..&coordenadas=lat,lng|&zona=..
void
locate(const search::Service &service, const httplib::Request &req, httplib::Response &res);

// POST /procesar-variables
void
processVariables(const search::Service &service, const httplib::Request &req, httplib::Response &res);

// Routes plus the error, exception and access log hooks
void
registerRoutes(httplib::Server &svr, const search::Service &service);

// "lat,lng" with both numbers in range
std::expected<models::Location, UNEXPECTED_CODE>
parseCoordinates(std::string_view text);

// Spanish weekday name ("lunes" .. "domingo") of a YYYY-MM-DD date
std::expected<std::string, UNEXPECTED_CODE>
weekdayFromDate(std::string_view date);

}
