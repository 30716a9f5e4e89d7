#include <catch2/catch_all.hpp>

#include "plan_report.hpp"

#include <filesystem>
#include <fstream>

namespace {

FoodIndex reportIndex() {
  FoodRecord ugali;
  ugali.id = "A015";
  ugali.nameEn = "Maize meal, cooked";
  ugali.nameSw = "Ugali";
  ugali.group = FoodGroup::Cereals;
  ugali.energy = 120.0;

  FoodRecord kale;
  kale.id = "E010";
  kale.nameEn = "Kale";
  kale.nameSw = "Sukuma wiki";
  kale.group = FoodGroup::Vegetables;
  kale.energy = 35.0;

  return FoodIndex({ugali, kale});
}

MealItem item(const std::string& food, double grams, std::optional<std::string> id) {
  MealItem i;
  i.food = food;
  i.grams = grams;
  i.foodId = std::move(id);
  i.unresolved = !i.foodId;
  i.matchScore = i.foodId ? 1.0 : 0.0;
  return i;
}

MealPlan twoDays() {
  MealPlan plan;
  plan.days.push_back(PlanDay{1, {Meal{MealSlot::Lunch, "Ugali na sukuma",
                                       {item("Ugali", 300, std::string("A015")), item("Sukuma wiki", 150, std::string("E010"))}}}});
  plan.days.push_back(PlanDay{2, {Meal{MealSlot::Lunch, "Ugali na chapati",
                                       {item("ugali", 200, std::string("A015")), item("Chapati", 80, std::nullopt)}}}});
  return plan;
}

} // namespace

TEST_CASE("shopping list totals grams per food", "[report]") {
  FoodIndex index = reportIndex();
  PriceCatalog prices;
  prices.set("A015", UnitPrice{100.0, PriceUnit::Kilogram});

  std::vector<ShoppingItem> list = buildShoppingList(twoDays(), index, prices);
  REQUIRE(list.size() == 3);
  REQUIRE(list[0].name == "Chapati");
  REQUIRE_FALSE(list[0].foodId.has_value());
  REQUIRE(list[1].name == "Kale");
  REQUIRE_FALSE(list[1].price.has_value());
  REQUIRE(list[2].name == "Maize meal, cooked");
  REQUIRE(list[2].grams == Catch::Approx(500.0));
  REQUIRE(list[2].occurrences == 2);
  REQUIRE(*list[2].price == Catch::Approx(50.0));
}

TEST_CASE("the report carries costs, nutrients and diagnostics", "[report]") {
  FoodIndex index = reportIndex();
  PriceCatalog prices;
  prices.set("A015", UnitPrice{100.0, PriceUnit::Kilogram});

  ClientProfile profile;
  profile.name = "Otieno";
  profile.age = 40;
  profile.sex = Sex::Male;
  profile.conditions = {HealthCondition::Hypertension};
  profile.budget = 1000.0;
  profile.durationDays = 2;

  AcceptedPlan accepted;
  accepted.plan = twoDays();
  accepted.attempts = 2;
  accepted.retries = 1;
  accepted.unresolved = {"Chapati"};
  accepted.trace = {StateTransition{1, ValidationState::Raw, ValidationState::Retry, "parse: empty output"}};

  CostedPlan costed = estimatePlanCost(accepted.plan, index, prices, profile.budget);
  std::vector<DayNutrients> nutrients = computeNutrientTotals(accepted.plan, index, {"energy_kcal"});
  nlohmann::json report = buildPlanReport(profile, accepted, costed, nutrients,
                                          buildShoppingList(accepted.plan, index, prices));

  REQUIRE(report["client"]["conditions"][0] == "Hypertension");
  REQUIRE(report["verdict"] == "partial-unknown");
  REQUIRE(report["total"].get<double>() == Catch::Approx(50.0));
  REQUIRE(report["delta"].get<double>() == Catch::Approx(-950.0));
  REQUIRE(report["days"].size() == 2);
  REQUIRE(report["days"][0]["nutrients"]["values"]["energy_kcal"].get<double>() == Catch::Approx(412.5));
  REQUIRE(report["days"][0]["nutrients"]["units"]["energy_kcal"] == "kcal");
  REQUIRE(report["days"][1]["meals"][0]["items"][1]["unresolved"] == true);
  REQUIRE(report["days"][1]["meals"][0]["items"][1]["price"].is_null());
  REQUIRE(report["shopping_list"].size() == 3);
  REQUIRE(report["diagnostics"]["retries"] == 1);
  REQUIRE(report["diagnostics"]["trace"][0]["to"] == "retry");

  std::filesystem::path out = std::filesystem::temp_directory_path() / "afyaplate_report.json";
  writePlanReport(report, out.string());
  std::ifstream in(out);
  REQUIRE(nlohmann::json::parse(in) == report);
}
