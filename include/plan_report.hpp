#pragma once

#include "client_profile.hpp"
#include "cost_estimator.hpp"
#include "food_index.hpp"
#include "nutrient_totals.hpp"
#include "plan_validator.hpp"
#include "price_catalog.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

struct ShoppingItem {
  std::optional<std::string> foodId;  // empty for unresolved items
  std::string name;
  double grams = 0.0;
  int occurrences = 0;
  std::optional<double> price;
};

// One line per resolved food (or per unresolved name), ordered by name.
std::vector<ShoppingItem> buildShoppingList(const MealPlan& plan, const FoodIndex& index, const PriceCatalog& catalog);

// The hand-off document for the report layer.
nlohmann::json buildPlanReport(const ClientProfile& profile, const AcceptedPlan& accepted, const CostedPlan& costed,
                               const std::vector<DayNutrients>& nutrients, const std::vector<ShoppingItem>& shopping);

// Writes report to path (pretty-printed), or to stdout when path is empty.
void writePlanReport(const nlohmann::json& report, const std::string& path);
