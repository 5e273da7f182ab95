#pragma once

#include <optional>
#include <string>
#include <vector>

namespace models {
  struct Location {
    double
      lat;
    double
      lng;
  };

  struct BoundingBox {
    double
      lat_min;
    double
      lat_max;
    double
      lon_min;
    double
      lon_max;
  };

  // Public listing shape of GET /restaurantes/{city}
  struct RestaurantListing {
    std::string
      titulo;
    double
      estrellas;
    std::string
      rango_de_precios;
    std::string
      url_maps;
  };

  struct Restaurant: public RestaurantListing {
    long long
      id;
    std::optional<std::string>
      bh_message;
    std::optional<std::string>
      url;
    std::string
      categorias;
    Location
      location;
    double
      nbh2;
  };

  struct SearchFilters {
    std::string
      city;
    std::optional<std::string>
      date;
    std::optional<std::string>
      price_range;
    std::optional<std::string>
      cocina;
    std::optional<std::string>
      diet;
    std::optional<std::string>
      dish;
    std::optional<std::string>
      zona;
    std::optional<Location>
      coordenadas;
  };

  // What the database layer runs: one city, optional box, AND of the clauses
  struct RestaurantQuery {
    std::string
      city;
    std::vector<std::string>
      price_ranges;
    std::vector<std::string>
      cuisines;
    std::optional<std::string>
      diet;
    std::vector<std::string>
      dishes;
    std::optional<BoundingBox>
      box;
    int
      limit = 10;
  };
}
