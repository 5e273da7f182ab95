#pragma once

#include <string>

#include "models.hpp"

namespace geo {

// Kilometres between two points, earth radius 6367 km
double haversine(double lon1, double lat1, double lon2, double lat2);

// Square box of radiusKm around a point, 1 degree of latitude ~ 111.32 km
models::BoundingBox boundingBox(double lat, double lon, double radiusKm = 1.0);

// "AND({location/lat} >= ..., ...)" filter formula describing the box
std::string filterFormula(const models::BoundingBox &box);

bool contains(const models::BoundingBox &box, const models::Location &location);

}
