#include <catch2/catch_all.hpp>

#include "errors.hpp"
#include "price_catalog.hpp"

#include <filesystem>
#include <fstream>

namespace {

FoodRecord food(const std::string& id, const std::string& en, const std::string& sw = "") {
  FoodRecord r;
  r.id = id;
  r.nameEn = en;
  r.nameSw = sw;
  return r;
}

} // namespace

TEST_CASE("prices are keyed by id or by name, in several units", "[prices]") {
  PriceCatalog catalog = parsePriceCatalog(R"({
    "A015": {"price": 80, "unit": "kg"},
    "Sukuma wiki": {"price": 5, "unit": "100g"},
    "milk": {"price": 60, "unit": "l"},
    "Rice": 200,
    "Saffron": {"price": 3, "unit": "g"},
    "Cooking oil": {"price": 0.4, "unit": "ml"}
  })");

  REQUIRE(catalog.size() == 6);
  REQUIRE(*catalog.costFor(food("A015", "Maize meal"), 500) == Catch::Approx(40.0));
  REQUIRE(*catalog.costFor(food("E010", "Kale", "Sukuma Wiki"), 200) == Catch::Approx(10.0));
  REQUIRE(*catalog.costFor(food("J001", "Milk"), 250) == Catch::Approx(15.0));
  REQUIRE(*catalog.costFor(food("A030", "rice"), 1000) == Catch::Approx(200.0));
  REQUIRE(*catalog.costFor(food("M001", "Saffron"), 2) == Catch::Approx(6.0));
  REQUIRE(*catalog.costFor(food("K001", "Cooking oil"), 10) == Catch::Approx(4.0));
  REQUIRE_FALSE(catalog.costFor(food("F020", "Mango"), 100).has_value());
}

TEST_CASE("an id entry wins over a name entry", "[prices]") {
  PriceCatalog catalog;
  catalog.set("Beans", UnitPrice{100.0, PriceUnit::Kilogram});
  catalog.set("C004", UnitPrice{300.0, PriceUnit::Kilogram});
  REQUIRE(catalog.priceFor(food("C004", "Beans"))->amount == Catch::Approx(300.0));
  REQUIRE(catalog.priceFor(food("C009", "beans"))->amount == Catch::Approx(100.0));
}

TEST_CASE("unusable price entries are skipped", "[prices]") {
  PriceCatalog catalog = parsePriceCatalog(R"({
    "Ugali": {"price": 70, "unit": "bushel"},
    "Beans": {"price": "cheap"},
    "Eggs": -5,
    "Tea": {"price": 600, "unit": "kg"}
  })");
  REQUIRE(catalog.size() == 1);
  REQUIRE(catalog.priceFor(food("L001", "Tea")).has_value());
  REQUIRE_FALSE(catalog.priceFor(food("A015", "Ugali")).has_value());
}

TEST_CASE("malformed price files throw, missing ones are empty", "[prices]") {
  REQUIRE_THROWS_AS(parsePriceCatalog("{\"Ugali\": 70,"), DatasetError);
  REQUIRE_THROWS_AS(parsePriceCatalog("[1, 2]"), DatasetError);

  std::filesystem::path absent = std::filesystem::temp_directory_path() / "afyaplate_no_such_prices.json";
  std::filesystem::remove(absent);
  REQUIRE(loadPriceCatalog(absent.string()).size() == 0);

  std::filesystem::path file = std::filesystem::temp_directory_path() / "afyaplate_prices.json";
  std::ofstream(file) << "{\"Ugali\": 70}";
  REQUIRE(loadPriceCatalog(file.string()).size() == 1);
}

TEST_CASE("unit names are recognised loosely", "[prices]") {
  REQUIRE(priceUnitFromString("KG") == PriceUnit::Kilogram);
  REQUIRE(priceUnitFromString("per 100 g") == PriceUnit::Per100Gram);
  REQUIRE(priceUnitFromString("Litre") == PriceUnit::Litre);
  REQUIRE_FALSE(priceUnitFromString("dozen").has_value());
  REQUIRE((UnitPrice{50.0, PriceUnit::Per100Gram}.perGram() == Catch::Approx(0.5)));
}
