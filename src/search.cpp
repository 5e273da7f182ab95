#include "search.hpp"
#include "database.hpp"
#include "geo.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace search {

namespace {

std::string lowercase(std::string_view value) {
  std::string result{value};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

void appendUnique(Restaurants &found, const Restaurants &page) {
  std::unordered_set<long long> seen;
  for (const auto &restaurant : found) {
    seen.insert(restaurant.id);
  }

  for (const auto &restaurant : page) {
    if (seen.insert(restaurant.id).second) {
      found.push_back(restaurant);
    }
  }
}

void sortByDistance(Restaurants &restaurants, const models::Location &centre) {
  std::stable_sort(restaurants.begin(), restaurants.end(), [&](const auto &a, const auto &b) {
    return geo::haversine(centre.lng, centre.lat, a.location.lng, a.location.lat)
      < geo::haversine(centre.lng, centre.lat, b.location.lng, b.location.lat);
  });
}

models::RestaurantQuery baseQuery(const models::SearchFilters &filters) {
  models::RestaurantQuery query;
  query.city = trim(filters.city);

  if (filters.price_range) {
    query.price_ranges = splitList(*filters.price_range);
  }
  if (filters.cocina) {
    query.cuisines = splitList(*filters.cocina);
  }
  if (filters.diet) {
    auto diet = trim(*filters.diet);
    if (!diet.empty()) {
      query.diet = std::move(diet);
    }
  }
  if (filters.dish) {
    query.dishes = splitList(*filters.dish);
  }

  return query;
}

std::string cacheKey(const models::SearchFilters &filters) {
  auto optional = [](const std::optional<std::string> &value) {
    return value ? lowercase(trim(*value)) : std::string{"-"};
  };

  std::string key = std::format("search|{}|{}|{}|{}|{}|{}",
      lowercase(trim(filters.city)),
      optional(filters.price_range),
      optional(filters.cocina),
      optional(filters.diet),
      optional(filters.dish),
      optional(filters.zona));

  if (filters.coordenadas) {
    key += std::format("|{},{}", filters.coordenadas->lat, filters.coordenadas->lng);
  }

  return key;
}

std::expected<Restaurants, UNEXPECTED_CODE>
searchZones(database::Connection *connection, const models::RestaurantQuery &base,
            const std::vector<std::string> &zones, const Options &options) {
  Restaurants found;

  for (const auto &zone : zones) {
    auto location = database::getZoneLocation(connection, base.city, zone);

    if (!location.has_value()) {
      if (location.error() == UNEXPECTED_CODE::NOT_FOUND) {
        logging::error("Zona '{}' no encontrada en {}", zone, base.city);
        continue;
      }
      return std::unexpected(location.error());
    }

    auto query = base;
    query.box = geo::boundingBox(location->lat, location->lng, options.zoneRadiusKm);
    query.limit = options.perZoneResults;

    logging::debug("Filtro para zona '{}': {}", zone, geo::filterFormula(*query.box));

    auto page = database::findRestaurants(connection, query);
    if (!page.has_value()) {
      return std::unexpected(page.error());
    }

    appendUnique(found, *page);
  }

  return found;
}

std::expected<Restaurants, UNEXPECTED_CODE>
searchAround(database::Connection *connection, const models::RestaurantQuery &base,
             const models::Location &centre, const Options &options) {
  auto query = base;
  query.box = geo::boundingBox(centre.lat, centre.lng, options.coordinatesRadiusKm);
  query.limit = options.maxResults;

  logging::debug("Filtro para ({}, {}): {}", centre.lat, centre.lng, geo::filterFormula(*query.box));

  auto found = database::findRestaurants(connection, query);
  if (found.has_value() && options.sortByProximity) {
    sortByDistance(*found, centre);
  }

  return found;
}

std::expected<Restaurants, UNEXPECTED_CODE>
searchCity(database::Connection *connection, const models::RestaurantQuery &base, const Options &options) {
  auto centre = database::getCityLocation(connection, base.city);

  if (!centre.has_value()) {
    if (centre.error() != UNEXPECTED_CODE::NOT_FOUND) {
      return std::unexpected(centre.error());
    }

    logging::warn("Sin coordenadas para '{}', buscando en toda la ciudad", base.city);

    auto query = base;
    query.limit = options.maxResults;
    return database::findRestaurants(connection, query);
  }

  Restaurants found;
  const auto wanted = static_cast<std::size_t>(std::max(options.maxResults, 0));

  for (double radius = options.initialRadiusKm; radius <= options.maxRadiusKm + 1e-9;
       radius += options.radiusStepKm) {
    auto query = base;
    query.box = geo::boundingBox(centre->lat, centre->lng, radius);
    query.limit = options.maxResults;

    logging::debug("Filtro para {} ({} km): {}", base.city, radius, geo::filterFormula(*query.box));

    auto page = database::findRestaurants(connection, query);
    if (!page.has_value()) {
      return std::unexpected(page.error());
    }

    appendUnique(found, *page);

    if (found.size() >= wanted || options.radiusStepKm <= 0) {
      break;
    }
  }

  if (options.sortByProximity) {
    sortByDistance(found, *centre);
  }

  if (found.size() > wanted) {
    found.resize(wanted);
  }

  return found;
}

}

std::string trim(std::string_view value) {
  auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };

  while (!value.empty() && isSpace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && isSpace(value.back())) {
    value.remove_suffix(1);
  }

  return std::string{value};
}

std::vector<std::string> splitList(std::string_view value) {
  std::vector<std::string> items;

  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string_view::npos) {
      end = value.size();
    }

    auto item = trim(value.substr(start, end - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }

    start = end + 1;
  }

  return items;
}

Service::Service(std::string databasePath, Options options)
  : databasePath(std::move(databasePath)),
    settings(options),
    cache(std::make_unique<TtlCache<Restaurants>>(options.cacheTtl, options.cacheSize)) {}

std::expected<Restaurants, UNEXPECTED_CODE>
Service::byCity(std::string_view city) const {
  const auto name = trim(city);

  if (name.empty()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  const auto key = "city|" + lowercase(name);
  if (auto cached = cache->get(key)) {
    logging::debug("Cache hit: {}", key);
    return *cached;
  }

  try {
    auto connection = database::getConnection(databasePath);
    auto result = database::getRestaurantsByCity(connection.get(), name, settings.maxResults);

    if (result.has_value()) {
      cache->put(key, *result);
    }

    return result;
  } catch (const std::runtime_error &e) {
    logging::error("Error al obtener restaurantes de {}: {}", name, e.what());
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }
}

std::expected<Restaurants, UNEXPECTED_CODE>
Service::search(const models::SearchFilters &filters) const {
  if (trim(filters.city).empty()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  const auto key = cacheKey(filters);
  if (auto cached = cache->get(key)) {
    logging::debug("Cache hit: {}", key);
    return *cached;
  }

  try {
    auto result = runSearch(filters);

    if (result.has_value()) {
      cache->put(key, *result);
    }

    return result;
  } catch (const std::runtime_error &e) {
    logging::error("Error al buscar restaurantes en {}: {}", filters.city, e.what());
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }
}

std::expected<Restaurants, UNEXPECTED_CODE>
Service::runSearch(const models::SearchFilters &filters) const {
  const auto base = baseQuery(filters);
  auto connection = database::getConnection(databasePath);

  if (filters.zona) {
    const auto zones = splitList(*filters.zona);
    if (!zones.empty()) {
      return searchZones(connection.get(), base, zones, settings);
    }
  }

  if (filters.coordenadas) {
    return searchAround(connection.get(), base, *filters.coordenadas, settings);
  }

  return searchCity(connection.get(), base, settings);
}

std::expected<models::Location, UNEXPECTED_CODE>
Service::locateZone(std::string_view city, std::string_view zone) const {
  const auto cityName = trim(city);
  const auto zoneName = trim(zone);

  if (cityName.empty() || zoneName.empty()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_ARGUMENT);
  }

  try {
    auto connection = database::getConnection(databasePath);
    return database::getZoneLocation(connection.get(), cityName, zoneName);
  } catch (const std::runtime_error &e) {
    logging::error("Error al obtener coordenadas de la zona {}: {}", zoneName, e.what());
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }
}

}
