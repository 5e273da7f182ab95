#include "routes.hpp"
#include "geo.hpp"
#include "logging.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <exception>
#include <format>
#include <optional>
#include <utility>

#include "nlohmann/json.hpp"

namespace routes {

namespace {

constexpr const char *NO_DESCRIPTION = "Sin descripción";
constexpr const char *NO_URL = "No especificado";

void
reply(httplib::Response &res, int status, const nlohmann::json &data) {
  res.status = status;
  res.set_content(data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void
replyDetail(httplib::Response &res, int status, std::string_view message) {
  nlohmann::json data;
  data["detail"] = message;
  reply(res, status, data);
}

nlohmann::json
nullable(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json
listing(const models::RestaurantListing &restaurant) {
  nlohmann::json data;
  data["titulo"] = restaurant.titulo;
  data["estrellas"] = restaurant.estrellas;
  data["rango_de_precios"] = restaurant.rango_de_precios;
  data["url_maps"] = restaurant.url_maps;
  return data;
}

std::string
fullUrl(const httplib::Request &req) {
  auto host = req.get_header_value("Host");
  if (host.empty()) {
    host = "localhost";
  }
  return "http://" + host + req.target;
}

// Strings pass through, numbers are printed, string arrays are joined with ','.
// Blank text counts as absent.
std::expected<std::optional<std::string>, UNEXPECTED_CODE>
textField(const nlohmann::json &data, const char *key) {
  auto it = data.find(key);

  if (it == data.end() || it->is_null()) {
    return std::optional<std::string>{};
  }

  if (it->is_string()) {
    auto text = it->get<std::string>();
    if (search::trim(text).empty()) {
      return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(text)};
  }

  if (it->is_number()) {
    return std::optional<std::string>{it->dump()};
  }

  if (it->is_array()) {
    std::string joined;
    for (const auto &item : *it) {
      if (!item.is_string()) {
        return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
      }
      if (!joined.empty()) {
        joined += ',';
      }
      joined += item.get<std::string>();
    }
    if (search::trim(joined).empty()) {
      return std::optional<std::string>{};
    }
    return std::optional<std::string>{joined};
  }

  return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
}

std::expected<std::optional<models::Location>, UNEXPECTED_CODE>
coordinatesField(const nlohmann::json &data) {
  auto it = data.find("coordenadas");

  if (it == data.end() || it->is_null()) {
    return std::optional<models::Location>{};
  }

  if (it->is_string()) {
    const auto text = it->get<std::string>();
    if (search::trim(text).empty()) {
      return std::optional<models::Location>{};
    }

    auto location = parseCoordinates(text);
    if (!location.has_value()) {
      return std::unexpected(location.error());
    }
    return std::optional<models::Location>{*location};
  }

  if (it->is_array() && it->size() == 2 && (*it)[0].is_number() && (*it)[1].is_number()) {
    return parseCoordinates(std::format("{},{}", (*it)[0].get<double>(), (*it)[1].get<double>()))
      .transform([](const models::Location &location) { return std::optional<models::Location>{location}; });
  }

  return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
}

std::optional<double>
parseNumber(std::string_view text) {
  const auto item = search::trim(text);
  double value = 0;

  auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
  if (item.empty() || ec != std::errc{} || ptr != item.data() + item.size() || !std::isfinite(value)) {
    return std::nullopt;
  }

  return value;
}

std::optional<int>
parseDigits(std::string_view text) {
  int value = 0;

  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }

  return value;
}

}

void
index(const httplib::Request &, httplib::Response &res) {
  nlohmann::json data;
  data["message"] = "Bienvenido a la API de búsqueda de restaurantes";
  reply(res, 200, data);
}

void
restaurantsByCity(const search::Service &service, const httplib::Request &req, httplib::Response &res) {

  auto param = req.path_params.find("city");

  if (param == req.path_params.end()) {
    replyDetail(res, 400, "El parámetro 'city' es obligatorio");
    return;
  }

  auto result = service.byCity(param->second);

  if (!result.has_value()) {
    switch(result.error()) {
      case UNEXPECTED_CODE::INVALID_ARGUMENT:
        replyDetail(res, 400, "El parámetro 'city' es obligatorio");
        break;
      case UNEXPECTED_CODE::NOT_FOUND:
        replyDetail(res, 404, "No se encontraron restaurantes");
        break;
      case UNEXPECTED_CODE::UNKNOWN:
        replyDetail(res, 500, "Error al obtener restaurantes de la ciudad");
        break;
    }

    return;
  }

  if (result->empty()) {
    replyDetail(res, 404, "No se encontraron restaurantes");
    return;
  }

  nlohmann::json data;
  data["resultados"] = nlohmann::json::array();

  for (const auto &restaurant : *result) {
    data["resultados"].push_back(listing(restaurant));
  }

  reply(res, 200, data);
}

void
locate(const search::Service &service, const httplib::Request &req, httplib::Response &res) {

  if (!req.has_param("city")) {
    replyDetail(res, 422, "El parámetro 'city' es obligatorio");
    return;
  }

  const auto city = req.get_param_value("city");
  const auto coordenadas = req.get_param_value("coordenadas");
  const double radiusKm = service.options().coordinatesRadiusKm;

  logging::info("Coordenadas recibidas en getRestaurants: {}", coordenadas);

  if (!search::trim(coordenadas).empty()) {
    auto location = parseCoordinates(coordenadas);

    if (!location.has_value()) {
      replyDetail(res, 400, "Formato de coordenadas inválido");
      return;
    }

    const auto box = geo::boundingBox(location->lat, location->lng, radiusKm);

    nlohmann::json data;
    data["coordenadas"] = {location->lat, location->lng};
    data["formula"] = geo::filterFormula(box);
    reply(res, 200, data);
    return;
  }

  const auto zona = req.get_param_value("zona");

  if (search::trim(zona).empty()) {
    replyDetail(res, 400, "Debes especificar zona o coordenadas si no usas city.");
    return;
  }

  auto location = service.locateZone(city, zona);

  if (!location.has_value()) {
    switch(location.error()) {
      case UNEXPECTED_CODE::INVALID_ARGUMENT:
        replyDetail(res, 422, "El parámetro 'city' es obligatorio");
        break;
      case UNEXPECTED_CODE::NOT_FOUND:
        replyDetail(res, 404, "Zona o ciudad no encontrada");
        break;
      case UNEXPECTED_CODE::UNKNOWN:
        replyDetail(res, 500, "Error interno del servidor");
        break;
    }

    return;
  }

  const auto box = geo::boundingBox(location->lat, location->lng, radiusKm);

  nlohmann::json data;
  data["lat"] = location->lat;
  data["lng"] = location->lng;
  data["formula"] = geo::filterFormula(box);
  reply(res, 200, data);
}

void
processVariables(const search::Service &service, const httplib::Request &req, httplib::Response &res) {
  nlohmann::json data = nlohmann::json::parse(req.body, nullptr, false);

  if (data.is_discarded() || !data.is_object()) {
    replyDetail(res, 400, "El cuerpo de la petición debe ser un objeto JSON");
    return;
  }

  logging::info("Datos recibidos: {}", data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

  models::SearchFilters filters;
  std::optional<std::string> city;

  const std::array<std::pair<const char *, std::optional<std::string> *>, 7> fields{{
    {"city", &city},
    {"date", &filters.date},
    {"price_range", &filters.price_range},
    {"cocina", &filters.cocina},
    {"diet", &filters.diet},
    {"dish", &filters.dish},
    {"zona", &filters.zona},
  }};

  for (const auto &[key, target] : fields) {
    auto value = textField(data, key);
    if (!value.has_value()) {
      replyDetail(res, 400, std::format("La variable '{}' no tiene un formato válido.", key));
      return;
    }
    *target = std::move(*value);
  }

  if (!city || search::trim(*city).empty()) {
    replyDetail(res, 400, "La variable 'city' es obligatoria.");
    return;
  }
  filters.city = *city;

  std::optional<std::string> weekday;
  if (filters.date) {
    auto parsed = weekdayFromDate(*filters.date);
    if (!parsed.has_value()) {
      replyDetail(res, 400, "La fecha proporcionada no tiene el formato correcto (YYYY-MM-DD).");
      return;
    }
    weekday = *parsed;
  }

  auto coordinates = coordinatesField(data);
  if (!coordinates.has_value()) {
    replyDetail(res, 400, "Formato de coordenadas inválido");
    return;
  }
  filters.coordenadas = *coordinates;

  auto result = service.search(filters);

  if (!result.has_value()) {
    if (result.error() == UNEXPECTED_CODE::INVALID_ARGUMENT) {
      replyDetail(res, 400, "La variable 'city' es obligatoria.");
      return;
    }

    nlohmann::json error;
    error["error"] = "Ocurrió un error al procesar las variables";
    reply(res, 500, error);
    return;
  }

  nlohmann::json response;
  response["request_info"] = std::format("{} {} HTTP/1.1 200 OK", req.method, fullUrl(req));
  response["variables"]["city"] = filters.city;
  response["variables"]["zone"] = nullable(filters.zona);
  response["variables"]["cuisine_type"] = nullable(filters.cocina);
  response["variables"]["price_range"] = nullable(filters.price_range);
  response["variables"]["date"] = nullable(filters.date);
  response["variables"]["dia_semana"] = nullable(weekday);
  response["variables"]["alimentary_restrictions"] = nullable(filters.diet);
  response["variables"]["specific_dishes"] = nullable(filters.dish);

  if (result->empty()) {
    response["mensaje"] = "No se encontraron restaurantes con los filtros aplicados.";
    reply(res, 200, response);
    return;
  }

  response["resultados"] = nlohmann::json::array();
  for (const auto &restaurant : *result) {
    nlohmann::json item;
    item["bh_message"] = restaurant.bh_message.value_or(NO_DESCRIPTION);
    item["url"] = restaurant.url.value_or(NO_URL);
    response["resultados"].push_back(item);
  }

  reply(res, 200, response);
}

void
registerRoutes(httplib::Server &svr, const search::Service &service) {

  svr.Get("/", index);

  svr.Get(R"(/restaurantes/:city)", [&service](const httplib::Request &req, httplib::Response &res) {
    restaurantsByCity(service, req, res);
  });

  svr.Get("/api/getRestaurants", [&service](const httplib::Request &req, httplib::Response &res) {
    locate(service, req, res);
  });

  svr.Post("/procesar-variables", [&service](const httplib::Request &req, httplib::Response &res) {
    processVariables(service, req, res);
  });

  // Unrouted requests and bare error statuses still answer with a JSON body
  svr.set_error_handler([](const httplib::Request &, httplib::Response &res) {
    if (!res.body.empty()) {
      return;
    }
    replyDetail(res, res.status, res.status == 404 ? "Recurso no encontrado" : "Solicitud no válida");
  });

  svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      logging::error("[LOG:500] {} {}: {}", req.method, req.path, e.what());
    } catch (...) {
      logging::error("[LOG:500] {} {}: excepción desconocida", req.method, req.path);
    }

    replyDetail(res, 500, "Error interno del servidor");
  });

  svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
    if (logging::getLevel() <= logging::LEVEL::INFO) {
      logging::write("HTTP", logging::LEVEL::INFO, std::format("{} {} {}", req.method, req.path, res.status));
    }
  });
}

std::expected<models::Location, UNEXPECTED_CODE>
parseCoordinates(std::string_view text) {
  const auto parts = std::string{text};
  const auto comma = parts.find(',');

  if (comma == std::string::npos || parts.find(',', comma + 1) != std::string::npos) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  auto lat = parseNumber(std::string_view{parts}.substr(0, comma));
  auto lng = parseNumber(std::string_view{parts}.substr(comma + 1));

  if (!lat || !lng || std::abs(*lat) > 90.0 || std::abs(*lng) > 180.0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  return models::Location{*lat, *lng};
}

std::expected<std::string, UNEXPECTED_CODE>
weekdayFromDate(std::string_view date) {
  static constexpr std::array<const char *, 7> DAYS{
    "lunes", "martes", "miércoles", "jueves", "viernes", "sábado", "domingo"
  };

  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  auto year = parseDigits(date.substr(0, 4));
  auto month = parseDigits(date.substr(5, 2));
  auto day = parseDigits(date.substr(8, 2));

  if (!year || !month || !day || *year < 0 || *month < 0 || *day < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  const std::chrono::year_month_day ymd{
    std::chrono::year{*year},
    std::chrono::month{static_cast<unsigned>(*month)},
    std::chrono::day{static_cast<unsigned>(*day)}
  };

  if (!ymd.ok()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  const std::chrono::weekday weekday{std::chrono::sys_days{ymd}};
  return std::string{DAYS[weekday.iso_encoding() - 1]};
}

}
