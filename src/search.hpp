#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "models.hpp"
#include "ttl_cache.hpp"
#include "unexpected_codes.hpp"

namespace search {

struct Options {
  // Results returned by a city lookup and by a search without zones
  int maxResults = 10;
  // Per zone cap when searching several zones
  int perZoneResults = 10;
  double zoneRadiusKm = 1.0;
  double coordinatesRadiusKm = 2.0;
  // City centre searches grow from initialRadiusKm to maxRadiusKm until maxResults are found
  double initialRadiusKm = 0.5;
  double radiusStepKm = 0.5;
  double maxRadiusKm = 2.0;
  bool sortByProximity = true;
  std::chrono::seconds cacheTtl{0};
  std::size_t cacheSize = 10000;
};

using Restaurants = std::vector<models::Restaurant>;

std::string trim(std::string_view value);

// Splits a comma separated list, trimming items and dropping empty ones
std::vector<std::string> splitList(std::string_view value);

class Service {
public:
  Service(std::string databasePath, Options options = {});

  // Restaurants of a city in ranking order; INVALID_ARGUMENT for a blank city
  std::expected<Restaurants, UNEXPECTED_CODE>
  byCity(std::string_view city) const;

  std::expected<Restaurants, UNEXPECTED_CODE>
  search(const models::SearchFilters &filters) const;

  std::expected<models::Location, UNEXPECTED_CODE>
  locateZone(std::string_view city, std::string_view zone) const;

  const Options &options() const {
    return settings;
  }

private:
  std::expected<Restaurants, UNEXPECTED_CODE>
  runSearch(const models::SearchFilters &filters) const;

  std::string databasePath;
  Options settings;
  std::unique_ptr<TtlCache<Restaurants>> cache;
};

}
