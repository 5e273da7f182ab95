#include "geo.hpp"

#include <cmath>
#include <format>
#include <numbers>

namespace geo {

namespace {
  constexpr double EARTH_RADIUS_KM = 6367.0;
  constexpr double KM_PER_DEGREE_LAT = 111.32;

  double radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
  }
}

double haversine(double lon1, double lat1, double lon2, double lat2) {
  lon1 = radians(lon1);
  lat1 = radians(lat1);
  lon2 = radians(lon2);
  lat2 = radians(lat2);

  const double dlon = lon2 - lon1;
  const double dlat = lat2 - lat1;
  const double a = std::pow(std::sin(dlat / 2), 2)
    + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(dlon / 2), 2);

  return EARTH_RADIUS_KM * 2 * std::asin(std::sqrt(a));
}

models::BoundingBox boundingBox(double lat, double lon, double radiusKm) {
  const double deltaLat = radiusKm / KM_PER_DEGREE_LAT;
  const double deltaLon = radiusKm / (KM_PER_DEGREE_LAT * std::cos(radians(lat)));

  return models::BoundingBox{
    lat - deltaLat,
    lat + deltaLat,
    lon - deltaLon,
    lon + deltaLon
  };
}

std::string filterFormula(const models::BoundingBox &box) {
  return std::format(
      "AND({{location/lat}} >= {}, {{location/lat}} <= {}, "
      "{{location/lng}} >= {}, {{location/lng}} <= {})",
      box.lat_min, box.lat_max, box.lon_min, box.lon_max);
}

bool contains(const models::BoundingBox &box, const models::Location &location) {
  return location.lat >= box.lat_min && location.lat <= box.lat_max
    && location.lng >= box.lon_min && location.lng <= box.lon_max;
}

}
