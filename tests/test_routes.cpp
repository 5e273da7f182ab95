#include "routes.hpp"

#include <initializer_list>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "seeded_database.hpp"

namespace {

class RoutesTest : public ::testing::Test {
protected:
  RoutesTest() : service(db.path()) {}

  httplib::Response getCity(const std::string &city) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/restaurantes/" + city;
    req.path_params["city"] = city;

    httplib::Response res;
    routes::restaurantsByCity(service, req, res);
    return res;
  }

  httplib::Response locate(std::initializer_list<std::pair<const std::string, std::string>> params) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/api/getRestaurants";
    for (const auto &param : params) {
      req.params.insert(param);
    }

    httplib::Response res;
    routes::locate(service, req, res);
    return res;
  }

  httplib::Response post(const std::string &body) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/procesar-variables";
    req.target = "/procesar-variables";
    req.headers.emplace("Host", "localhost:9999");
    req.body = body;

    httplib::Response res;
    routes::processVariables(service, req, res);
    return res;
  }

  static nlohmann::json body(const httplib::Response &res) {
    return nlohmann::json::parse(res.body);
  }

  SeededDatabase db;
  search::Service service;
};

void expectListingSchema(const nlohmann::json &data) {
  ASSERT_TRUE(data.is_object());
  ASSERT_EQ(data.size(), 1U);
  ASSERT_TRUE(data.contains("resultados"));
  ASSERT_TRUE(data["resultados"].is_array());

  for (const auto &item : data["resultados"]) {
    ASSERT_TRUE(item.is_object());
    EXPECT_EQ(item.size(), 4U);
    ASSERT_TRUE(item["titulo"].is_string());
    EXPECT_FALSE(item["titulo"].get<std::string>().empty());
    EXPECT_TRUE(item["estrellas"].is_number());
    EXPECT_TRUE(item["rango_de_precios"].is_string());
    EXPECT_TRUE(item["url_maps"].is_string());
  }
}

}

TEST_F(RoutesTest, Index) {
  httplib::Request req;
  httplib::Response res;

  routes::index(req, res);

  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(body(res)["message"], "Bienvenido a la API de búsqueda de restaurantes");
}

TEST_F(RoutesTest, CityWithListings) {
  auto res = getCity("Madrid");

  ASSERT_EQ(res.status, 200);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");

  const auto data = body(res);
  expectListingSchema(data);
  ASSERT_EQ(data["resultados"].size(), 10U);
  EXPECT_EQ(data["resultados"][0].dump(),
            R"({"estrellas":4.5,"rango_de_precios":"$$","titulo":"Casa Pepe","url_maps":"https://maps.example/1"})");
}

TEST_F(RoutesTest, CityWithoutListingsIsNotFound) {
  auto res = getCity("Atlantis");

  EXPECT_EQ(res.status, 404);
  EXPECT_EQ(body(res)["detail"], "No se encontraron restaurantes");
}

TEST_F(RoutesTest, BlankCityIsBadRequest) {
  EXPECT_EQ(getCity(" ").status, 400);
  EXPECT_EQ(getCity("").status, 400);
}

TEST_F(RoutesTest, MissingCityParameterIsBadRequest) {
  httplib::Request req;
  httplib::Response res;

  routes::restaurantsByCity(service, req, res);

  EXPECT_EQ(res.status, 400);
}

TEST_F(RoutesTest, LocateWithCoordinates) {
  auto res = locate({{"city", "Madrid"}, {"coordenadas", "40.4168,-3.7038"}});

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);
  EXPECT_DOUBLE_EQ(data["coordenadas"][0].get<double>(), 40.4168);
  EXPECT_DOUBLE_EQ(data["coordenadas"][1].get<double>(), -3.7038);
  EXPECT_EQ(data["formula"].get<std::string>().rfind("AND({location/lat} >= 40.39", 0), 0U);
}

TEST_F(RoutesTest, LocateWithZone) {
  auto res = locate({{"city", "Madrid"}, {"zona", "Centro"}});

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);
  EXPECT_DOUBLE_EQ(data["lat"].get<double>(), 40.4155);
  EXPECT_DOUBLE_EQ(data["lng"].get<double>(), -3.7074);
  EXPECT_TRUE(data["formula"].is_string());
}

TEST_F(RoutesTest, LocateErrors) {
  EXPECT_EQ(locate({{"zona", "Centro"}}).status, 422);
  EXPECT_EQ(locate({{"city", "Madrid"}}).status, 400);
  EXPECT_EQ(locate({{"city", "Madrid"}, {"coordenadas", "norte"}}).status, 400);
  EXPECT_EQ(locate({{"city", "Madrid"}, {"coordenadas", "40.4"}}).status, 400);

  auto res = locate({{"city", "Madrid"}, {"zona", "Atlántida"}});
  EXPECT_EQ(res.status, 404);
  EXPECT_EQ(body(res)["detail"], "Zona o ciudad no encontrada");
}

TEST_F(RoutesTest, ProcessVariablesReturnsResults) {
  auto res = post(R"({"city": "Madrid", "price_range": "$", "date": "2024-05-17"})");

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);

  EXPECT_EQ(data["request_info"], "POST http://localhost:9999/procesar-variables HTTP/1.1 200 OK");
  EXPECT_EQ(data["variables"]["city"], "Madrid");
  EXPECT_EQ(data["variables"]["price_range"], "$");
  EXPECT_EQ(data["variables"]["date"], "2024-05-17");
  EXPECT_EQ(data["variables"]["dia_semana"], "viernes");
  EXPECT_TRUE(data["variables"]["zone"].is_null());
  EXPECT_FALSE(data.contains("mensaje"));

  ASSERT_EQ(data["resultados"].size(), 3U);
  EXPECT_EQ(data["resultados"][0]["bh_message"], "Menú del día casero.");
  EXPECT_EQ(data["resultados"][0]["url"], "No especificado");
  EXPECT_EQ(data["resultados"][1]["url"], "https://tabernadelsur.example");
}

TEST_F(RoutesTest, ProcessVariablesDefaultsMissingDescription) {
  auto res = post(R"({"city": "Madrid", "cocina": ["italiana"]})");

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);

  EXPECT_EQ(data["variables"]["cuisine_type"], "italiana");
  ASSERT_EQ(data["resultados"].size(), 2U);
  EXPECT_EQ(data["resultados"][0]["bh_message"], "Sin descripción");
  EXPECT_EQ(data["resultados"][0]["url"], "No especificado");
}

TEST_F(RoutesTest, ProcessVariablesWithCoordinateArray) {
  auto res = post(R"({"city": "Madrid", "coordenadas": [40.4297, -3.6772]})");

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);

  ASSERT_EQ(data["resultados"].size(), 3U);
  EXPECT_EQ(data["resultados"][0]["bh_message"], "Carnes a la brasa para ocasiones especiales.");
}

TEST_F(RoutesTest, ProcessVariablesIgnoresBlankFields) {
  auto res = post(R"({"city": "Madrid", "date": "", "coordenadas": " ", "zona": "", "cocina": [], "price_range": "$"})");

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);

  EXPECT_TRUE(data["variables"]["date"].is_null());
  EXPECT_TRUE(data["variables"]["dia_semana"].is_null());
  EXPECT_TRUE(data["variables"]["zone"].is_null());
  EXPECT_TRUE(data["variables"]["cuisine_type"].is_null());
  ASSERT_EQ(data["resultados"].size(), 3U);
  EXPECT_EQ(data["resultados"][0]["bh_message"], "Menú del día casero.");
}

TEST_F(RoutesTest, ProcessVariablesWithoutMatches) {
  auto res = post(R"({"city": "Atlantis"})");

  ASSERT_EQ(res.status, 200);
  const auto data = body(res);

  EXPECT_EQ(data["mensaje"], "No se encontraron restaurantes con los filtros aplicados.");
  EXPECT_FALSE(data.contains("resultados"));
  EXPECT_EQ(data["variables"]["city"], "Atlantis");
}

TEST_F(RoutesTest, ProcessVariablesValidation) {
  EXPECT_EQ(post("no es json").status, 400);
  EXPECT_EQ(post("[1, 2]").status, 400);

  auto missingCity = post(R"({"zona": "Centro"})");
  EXPECT_EQ(missingCity.status, 400);
  EXPECT_EQ(body(missingCity)["detail"], "La variable 'city' es obligatoria.");

  EXPECT_EQ(post(R"({"city": "  "})").status, 400);

  auto badDate = post(R"({"city": "Madrid", "date": "17/05/2024"})");
  EXPECT_EQ(badDate.status, 400);
  EXPECT_EQ(body(badDate)["detail"], "La fecha proporcionada no tiene el formato correcto (YYYY-MM-DD).");

  EXPECT_EQ(post(R"({"city": "Madrid", "coordenadas": "norte"})").status, 400);
  EXPECT_EQ(post(R"({"city": "Madrid", "coordenadas": [40.4]})").status, 400);
  EXPECT_EQ(post(R"({"city": "Madrid", "cocina": {"tipo": "italiana"}})").status, 400);
}

TEST(ParseCoordinatesTest, AcceptsLatLng) {
  auto location = routes::parseCoordinates(" 40.4168 , -3.7038 ");

  ASSERT_TRUE(location.has_value());
  EXPECT_DOUBLE_EQ(location->lat, 40.4168);
  EXPECT_DOUBLE_EQ(location->lng, -3.7038);
}

TEST(ParseCoordinatesTest, RejectsMalformedInput) {
  EXPECT_FALSE(routes::parseCoordinates("").has_value());
  EXPECT_FALSE(routes::parseCoordinates("40.4").has_value());
  EXPECT_FALSE(routes::parseCoordinates("1,2,3").has_value());
  EXPECT_FALSE(routes::parseCoordinates("40.4,").has_value());
  EXPECT_FALSE(routes::parseCoordinates("40.4x,-3").has_value());
  EXPECT_FALSE(routes::parseCoordinates("91,0").has_value());
  EXPECT_FALSE(routes::parseCoordinates("0,181").has_value());
}

TEST(WeekdayTest, SpanishNames) {
  EXPECT_EQ(routes::weekdayFromDate("2024-05-17").value(), "viernes");
  EXPECT_EQ(routes::weekdayFromDate("2024-02-29").value(), "jueves");
  EXPECT_EQ(routes::weekdayFromDate("2024-05-19").value(), "domingo");
  EXPECT_EQ(routes::weekdayFromDate("2024-05-13").value(), "lunes");
}

TEST(WeekdayTest, RejectsInvalidDates) {
  EXPECT_FALSE(routes::weekdayFromDate("2023-02-29").has_value());
  EXPECT_FALSE(routes::weekdayFromDate("2024-13-01").has_value());
  EXPECT_FALSE(routes::weekdayFromDate("2024-5-17").has_value());
  EXPECT_FALSE(routes::weekdayFromDate("2024/05/17").has_value());
  EXPECT_FALSE(routes::weekdayFromDate("").has_value());
}
