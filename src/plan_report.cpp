#include "plan_report.hpp"

#include "text_normalize.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

namespace {

nlohmann::json optionalNumber(const std::optional<double>& v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json totalsJson(const NutrientTotals& t) {
  nlohmann::json values = nlohmann::json::object();
  nlohmann::json units = nlohmann::json::object();
  for (const auto& kv : t.values) {
    values[kv.first] = kv.second;
    units[kv.first] = nutrientUnit(kv.first);
  }
  return {{"values", values}, {"units", units}, {"partial", t.partial}};
}

} // namespace

std::vector<ShoppingItem> buildShoppingList(const MealPlan& plan, const FoodIndex& index, const PriceCatalog& catalog) {
  std::map<std::string, ShoppingItem> byKey;
  for (const PlanDay& day : plan.days) {
    for (const Meal& meal : day.meals) {
      for (const MealItem& item : meal.items) {
        std::optional<FoodRecord> food = item.foodId ? index.findById(*item.foodId) : std::nullopt;
        std::string key = food ? "id:" + food->id : "name:" + normalizeForMatch(item.food);
        ShoppingItem& line = byKey[key];
        if (line.occurrences == 0) {
          line.name = food ? food->nameEn : item.food;
          if (food) line.foodId = food->id;
        }
        line.grams += item.grams;
        line.occurrences++;
      }
    }
  }

  std::vector<ShoppingItem> out;
  out.reserve(byKey.size());
  for (auto& kv : byKey) {
    ShoppingItem& line = kv.second;
    if (line.foodId) {
      std::optional<FoodRecord> food = index.findById(*line.foodId);
      if (food) line.price = catalog.costFor(*food, line.grams);
    }
    out.push_back(std::move(line));
  }
  std::sort(out.begin(), out.end(), [](const ShoppingItem& a, const ShoppingItem& b) {
    if (a.name != b.name) return a.name < b.name;
    return a.foodId.value_or("") < b.foodId.value_or("");
  });
  return out;
}

nlohmann::json buildPlanReport(const ClientProfile& profile, const AcceptedPlan& accepted, const CostedPlan& costed,
                               const std::vector<DayNutrients>& nutrients, const std::vector<ShoppingItem>& shopping) {
  nlohmann::json conditions = nlohmann::json::array();
  for (HealthCondition c : profile.conditions) conditions.push_back(healthConditionName(c));

  nlohmann::json days = nlohmann::json::array();
  for (size_t d = 0; d < costed.days.size(); ++d) {
    const CostedDay& day = costed.days[d];
    const DayNutrients* dn = d < nutrients.size() ? &nutrients[d] : nullptr;
    nlohmann::json meals = nlohmann::json::array();
    for (size_t m = 0; m < day.meals.size(); ++m) {
      const CostedMeal& meal = day.meals[m];
      nlohmann::json items = nlohmann::json::array();
      for (const CostedItem& ci : meal.items) {
        items.push_back({
          {"food", ci.item.food},
          {"food_id", ci.item.foodId ? nlohmann::json(*ci.item.foodId) : nlohmann::json(nullptr)},
          {"match_score", ci.item.matchScore},
          {"unresolved", ci.item.unresolved},
          {"grams", ci.item.grams},
          {"note", ci.item.note},
          {"price", optionalNumber(ci.price)},
        });
      }
      nlohmann::json mealJson = {
        {"slot", mealSlotName(meal.slot)},
        {"name", meal.name},
        {"subtotal", meal.subtotal},
        {"partial", meal.partial},
        {"items", items},
      };
      if (dn && m < dn->meals.size()) mealJson["nutrients"] = totalsJson(dn->meals[m].totals);
      meals.push_back(mealJson);
    }
    nlohmann::json dayJson = {
      {"day", day.dayNumber},
      {"subtotal", day.subtotal},
      {"partial", day.partial},
      {"meals", meals},
    };
    if (dn) dayJson["nutrients"] = totalsJson(dn->totals);
    days.push_back(dayJson);
  }

  nlohmann::json shoppingJson = nlohmann::json::array();
  for (const ShoppingItem& s : shopping) {
    shoppingJson.push_back({
      {"food_id", s.foodId ? nlohmann::json(*s.foodId) : nlohmann::json(nullptr)},
      {"name", s.name},
      {"grams", s.grams},
      {"occurrences", s.occurrences},
      {"price", optionalNumber(s.price)},
    });
  }

  nlohmann::json trace = nlohmann::json::array();
  for (const StateTransition& t : accepted.trace) {
    trace.push_back({
      {"attempt", t.attempt},
      {"from", validationStateName(t.from)},
      {"to", validationStateName(t.to)},
      {"detail", t.detail},
    });
  }

  return {
    {"client", {
      {"name", profile.name},
      {"age", profile.age},
      {"sex", sexName(profile.sex)},
      {"conditions", conditions},
      {"kcal_goal", profile.kcalGoal},
      {"duration_days", profile.durationDays},
    }},
    {"budget", costed.budget},
    {"total", costed.total},
    {"delta", costed.delta},
    {"partial", costed.partial},
    {"verdict", budgetVerdictName(costed.verdict)},
    {"days", days},
    {"shopping_list", shoppingJson},
    {"diagnostics", {
      {"attempts", accepted.attempts},
      {"retries", accepted.retries},
      {"unresolved", accepted.unresolved},
      {"trace", trace},
    }},
  };
}

void writePlanReport(const nlohmann::json& report, const std::string& path) {
  if (path.empty()) {
    std::cout << report.dump(2) << "\n";
    return;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("Cannot write report: " + path);
  out << report.dump(2) << "\n";
  if (!out) throw std::runtime_error("Failed while writing report: " + path);
  spdlog::info("Report: written to '{}'", path);
}
