#include <catch2/catch_all.hpp>

#include "plan_parser.hpp"

namespace {

PlanRequest requestFor(int days, std::vector<MealSlot> slots = {MealSlot::Breakfast, MealSlot::Lunch, MealSlot::Dinner}) {
  PlanRequest r;
  r.dayCount = days;
  r.slots = std::move(slots);
  return r;
}

const char* kOneDay = R"({"days": [{"day": 1, "meals": {
  "breakfast": {"name": "Uji", "items": [{"food": "Millet porridge", "grams": 300}]},
  "lunch": {"name": "Ugali na sukuma", "items": [{"food": "Ugali", "grams": 250}, {"food": "Sukuma wiki", "grams": 150}]},
  "dinner": {"name": "Githeri", "items": [{"food": "Githeri", "grams": 350, "note": "with avocado"}]}
}}]})";

nlohmann::json parsed(const std::string& text) {
  ParseResult r = parsePlanText(text);
  REQUIRE(std::holds_alternative<ParsedPlan>(r));
  return std::get<ParsedPlan>(r).document;
}

std::string violation(const std::string& text, const PlanRequest& request) {
  SchemaResult r = validatePlanSchema(parsed(text), request);
  REQUIRE(std::holds_alternative<SchemaViolation>(r));
  return std::get<SchemaViolation>(r).reason;
}

} // namespace

TEST_CASE("plan text is found inside fences and commentary", "[parser]") {
  std::string fenced = std::string("Here is your plan:\n```json\n") + kOneDay + "\n```\nEnjoy!";
  REQUIRE(parsed(fenced)["days"].size() == 1);

  std::string bom = std::string("\xEF\xBB\xBF") + kOneDay;
  REQUIRE(parsed(bom)["days"][0]["day"] == 1);

  std::string chatty = std::string("Sure! {not json} and then ") + kOneDay + " hope it helps {";
  REQUIRE(parsed(chatty)["days"][0]["meals"].contains("lunch"));
}

TEST_CASE("trailing commas are tolerated outside strings", "[parser]") {
  REQUIRE(removeTrailingCommas("{\"a\": [1, 2,], \"b\": \"x,}\",}") == "{\"a\": [1, 2], \"b\": \"x,}\"}");
  REQUIRE(parsed("{\"days\": [ {\"day\": 1,}, ],}")["days"].size() == 1);
}

TEST_CASE("brace matching ignores braces inside strings", "[parser]") {
  auto obj = extractFirstJsonObject("noise {\"a\": \"}{\", \"b\": {\"c\": 1}} tail");
  REQUIRE(obj);
  REQUIRE(*obj == "{\"a\": \"}{\", \"b\": {\"c\": 1}}");
  REQUIRE_FALSE(extractFirstJsonObject("{\"a\": 1").has_value());
}

TEST_CASE("output without a JSON object is malformed", "[parser]") {
  REQUIRE(std::holds_alternative<MalformedOutput>(parsePlanText("")));
  REQUIRE(std::holds_alternative<MalformedOutput>(parsePlanText("I cannot help with that.")));
  REQUIRE(std::holds_alternative<MalformedOutput>(parsePlanText("{\"days\": [")));
  REQUIRE(std::holds_alternative<MalformedOutput>(parsePlanText("{days: nope}")));
}

TEST_CASE("a well formed plan is typed and ordered", "[parser][schema]") {
  std::string text = R"({"meal_plan": {"days": [
    {"day": 2, "meals": {"lunch": {"name": "L", "items": [{"food": "Rice", "grams": 200}]}}},
    {"day": 1, "meals": [{"slot": "Lunch", "name": "L", "items": [{"name": "Beans", "grams": 180.5}]}]}
  ]}})";
  SchemaResult r = validatePlanSchema(parsed(text), requestFor(2, {MealSlot::Lunch}));
  REQUIRE(std::holds_alternative<MealPlan>(r));
  const MealPlan& plan = std::get<MealPlan>(r);
  REQUIRE(plan.days.size() == 2);
  REQUIRE(plan.days[0].dayNumber == 1);
  REQUIRE(plan.days[0].meals[0].items[0].food == "Beans");
  REQUIRE(plan.days[0].meals[0].items[0].grams == Catch::Approx(180.5));
  REQUIRE(plan.days[1].meals[0].items[0].food == "Rice");
}

TEST_CASE("meals come back in slot order", "[parser][schema]") {
  SchemaResult r = validatePlanSchema(parsed(kOneDay), requestFor(1));
  REQUIRE(std::holds_alternative<MealPlan>(r));
  const auto& meals = std::get<MealPlan>(r).days[0].meals;
  REQUIRE(meals.size() == 3);
  REQUIRE(meals[0].slot == MealSlot::Breakfast);
  REQUIRE(meals[2].items[0].note == "with avocado");
}

TEST_CASE("schema violations name what is wrong", "[parser][schema]") {
  REQUIRE(violation(kOneDay, requestFor(3)) == "expected 3 day(s), got 1");

  std::string twice = R"({"days": [
    {"day": 1, "meals": {"lunch": {"name": "L", "items": [{"food": "Rice", "grams": 200}]}}},
    {"day": 1, "meals": {"lunch": {"name": "L", "items": [{"food": "Rice", "grams": 200}]}}}]})";
  REQUIRE(violation(twice, requestFor(2, {MealSlot::Lunch})) == "day 1 appears twice");

  std::string noDinner = R"({"days": [{"day": 1, "meals": {
    "lunch": {"name": "L", "items": [{"food": "Rice", "grams": 200}]}}}]})";
  REQUIRE(violation(noDinner, requestFor(1, {MealSlot::Lunch, MealSlot::Dinner})) == "day 1 is missing dinner");

  std::string stringGrams = R"({"days": [{"day": 1, "meals": {
    "lunch": {"name": "L", "items": [{"food": "Rice", "grams": "200g"}]}}}]})";
  REQUIRE(violation(stringGrams, requestFor(1, {MealSlot::Lunch})) == "day 1 lunch item 1 ('Rice') needs a numeric 'grams'");

  std::string zeroGrams = R"({"days": [{"day": 1, "meals": {
    "lunch": {"name": "L", "items": [{"food": "Rice", "grams": 0}]}}}]})";
  REQUIRE(violation(zeroGrams, requestFor(1, {MealSlot::Lunch})) == "day 1 lunch item 1 ('Rice') has non-positive grams");

  std::string badSlot = R"({"days": [{"day": 1, "meals": {"brunch": {"name": "B", "items": []}}}]})";
  REQUIRE(violation(badSlot, requestFor(1, {MealSlot::Lunch})) == "day 1 has unknown meal slot 'brunch'");

  std::string outOfRange = R"({"days": [{"day": 4, "meals": {}}]})";
  REQUIRE(violation(outOfRange, requestFor(1, {MealSlot::Lunch})) == "day 4 outside 1..1");
}

TEST_CASE("day numbers too large for an int are out of range", "[parser][schema]") {
  std::string wide = R"({"days": [{"day": 4294967297, "meals": {"lunch": {"name": "L", "items": [{"food": "Rice", "grams": 100}]}}}]})";
  REQUIRE(violation(wide, requestFor(1, {MealSlot::Lunch})) == "day 4294967297 outside 1..1");

  std::string negative = R"({"days": [{"day": -4294967295, "meals": {}}]})";
  REQUIRE(violation(negative, requestFor(1, {MealSlot::Lunch})) == "day -4294967295 outside 1..1");

  std::string huge = R"({"days": [{"day": 1e20, "meals": {}}]})";
  std::string reason = violation(huge, requestFor(1, {MealSlot::Lunch}));
  REQUIRE_THAT(reason, Catch::Matchers::EndsWith(" outside 1..1"));
  REQUIRE(reason.find("-2147483648") == std::string::npos);

  std::string fractional = R"({"days": [{"day": 1.5, "meals": {}}]})";
  REQUIRE(violation(fractional, requestFor(1, {MealSlot::Lunch})) == "day entry 1 has no integer 'day'");

  std::string wholeFloat = R"({"days": [{"day": 1.0, "meals": {"lunch": {"name": "L", "items": [{"food": "Rice", "grams": 100}]}}}]})";
  SchemaResult typed = validatePlanSchema(parsed(wholeFloat), requestFor(1, {MealSlot::Lunch}));
  REQUIRE(std::holds_alternative<MealPlan>(typed));
  REQUIRE(std::get<MealPlan>(typed).days[0].dayNumber == 1);
}

TEST_CASE("empty slots pass only when allowed", "[parser][schema]") {
  std::string empty = R"({"days": [{"day": 1, "meals": {"lunch": {"name": "L", "items": []}}}]})";
  REQUIRE(violation(empty, requestFor(1, {MealSlot::Lunch})) == "day 1 lunch has no items");

  PlanRequest relaxed = requestFor(1, {MealSlot::Lunch, MealSlot::Dinner});
  relaxed.allowEmptySlots = true;
  REQUIRE(std::holds_alternative<MealPlan>(validatePlanSchema(parsed(empty), relaxed)));
}
