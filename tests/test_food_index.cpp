#include <catch2/catch_all.hpp>

#include "errors.hpp"
#include "food_index.hpp"

#include <future>
#include <string>
#include <vector>

namespace {

FoodRecord food(const std::string& id, const std::string& en, const std::string& sw, FoodGroup group,
                NutrientValue energy = std::nullopt) {
  FoodRecord r;
  r.id = id;
  r.nameEn = en;
  r.nameSw = sw;
  r.group = group;
  r.energy = energy;
  return r;
}

std::vector<FoodRecord> sampleFoods() {
  return {
    food("E010", "Kale, raw", "Sukuma wiki", FoodGroup::Vegetables, 35.0),
    food("A015", "Maize meal stiff porridge", "Ugali", FoodGroup::Cereals, 150.0),
    food("C004", "Beans, dry", "Maharagwe", FoodGroup::Legumes, 330.0),
    food("C001", "Beans, boiled", "Maharagwe yaliyochemshwa", FoodGroup::Legumes, 120.0),
    food("F020", "Mango, ripe", "Embe", FoodGroup::Fruits, 60.0),
  };
}

} // namespace

TEST_CASE("lookupExact matches either language after normalization", "[index]") {
  FoodIndex index(sampleFoods());

  auto ugali = index.lookupExact("  UGALI ", Language::Swahili);
  REQUIRE(ugali.has_value());
  REQUIRE(ugali->id == "A015");

  REQUIRE(index.lookupExact("kale raw", Language::English)->id == "E010");
  REQUIRE_FALSE(index.lookupExact("Ugali", Language::English).has_value());
  REQUIRE(index.lookupExact("Ugali", Language::Any)->id == "A015");
  REQUIRE_FALSE(index.lookupExact("Chapati", Language::Any).has_value());
}

TEST_CASE("lookupPrefix returns candidates ordered by id", "[index]") {
  FoodIndex index(sampleFoods());
  auto beans = index.lookupPrefix("beans", Language::English, 10);
  REQUIRE(beans.size() == 2);
  REQUIRE(beans[0].id == "C001");
  REQUIRE(beans[1].id == "C004");

  REQUIRE(index.lookupPrefix("beans", Language::English, 1).size() == 1);
  REQUIRE(index.lookupPrefix("mahara", Language::Swahili, 10).size() == 2);
  REQUIRE(index.lookupPrefix("mahara", Language::English, 10).empty());
}

TEST_CASE("lookupFuzzy scores, orders and gates candidates", "[index]") {
  FoodIndex index(sampleFoods());

  auto misspelt = index.lookupFuzzy("Ugaly", Language::Any, 3);
  REQUIRE_FALSE(misspelt.empty());
  REQUIRE(misspelt[0].record.id == "A015");
  REQUIRE(misspelt[0].score >= 0.75);

  // both bean records contain every query token: equal scores, id breaks the tie
  auto beans = index.lookupFuzzy("beans", Language::English, 5);
  REQUIRE(beans.size() == 2);
  REQUIRE(beans[0].score == Catch::Approx(beans[1].score));
  REQUIRE(beans[0].record.id == "C001");
  REQUIRE(beans[1].record.id == "C004");

  for (const auto& m : index.lookupFuzzy("kale", Language::Any, 5)) REQUIRE(m.score >= index.fuzzyThreshold());
  REQUIRE(index.lookupFuzzy("spaceship", Language::Any, 5).empty());
  REQUIRE(index.lookupFuzzy("beans", Language::English, 0).empty());
}

TEST_CASE("a stricter threshold returns fewer candidates", "[index]") {
  IndexOptions strict;
  strict.fuzzyThreshold = 0.99;
  FoodIndex index(sampleFoods(), strict);
  REQUIRE(index.lookupFuzzy("Ugaly", Language::Any, 3).empty());
}

TEST_CASE("filterByGroup and findById", "[index]") {
  FoodIndex index(sampleFoods());
  auto legumes = index.filterByGroup(FoodGroup::Legumes);
  REQUIRE(legumes.size() == 2);
  REQUIRE(legumes[0].id == "C001");
  REQUIRE(index.filterByGroup(FoodGroup::Fish).empty());
  REQUIRE(index.findById("F020")->nameSw == "Embe");
  REQUIRE_FALSE(index.findById("Z999").has_value());
}

TEST_CASE("construction rejects duplicate ids and negative nutrients", "[index]") {
  std::vector<FoodRecord> dup = sampleFoods();
  dup.push_back(food("A015", "Another", "", FoodGroup::Cereals));
  REQUIRE_THROWS_AS(FoodIndex(dup), DatasetError);

  std::vector<FoodRecord> negative = {food("X1", "Odd", "", FoodGroup::Miscellaneous, -1.0)};
  REQUIRE_THROWS_AS(FoodIndex(negative), DatasetError);
}

TEST_CASE("FoodIndexStore swaps snapshots without disturbing readers", "[index]") {
  FoodIndexStore store;
  REQUIRE(store.current() == nullptr);

  store.commit(std::make_shared<const FoodIndex>(sampleFoods()));
  auto before = store.current();
  REQUIRE(store.version() == 1);

  std::vector<std::future<bool>> readers;
  for (int i = 0; i < 8; ++i) {
    readers.push_back(std::async(std::launch::async, [&store] {
      auto snapshot = store.current();
      bool ok = true;
      for (int n = 0; n < 200; ++n) ok = ok && snapshot->lookupExact("Ugali", Language::Any).has_value();
      return ok;
    }));
  }

  std::vector<FoodRecord> smaller = {food("A015", "Maize meal stiff porridge", "Ugali", FoodGroup::Cereals, 150.0)};
  store.commit(std::make_shared<const FoodIndex>(smaller));

  for (auto& r : readers) REQUIRE(r.get());
  REQUIRE(before->size() == 5);
  REQUIRE(store.current()->size() == 1);
  REQUIRE(store.version() == 2);
}
