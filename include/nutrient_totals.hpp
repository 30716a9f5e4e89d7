#pragma once

#include "food_index.hpp"
#include "meal_plan.hpp"

#include <map>
#include <string>
#include <vector>

// Sums of portion-scaled per-100 g values. partial is set when an item is
// unresolved or a resolved food lacks one of the requested nutrients; the
// sums then cover only what is known.
struct NutrientTotals {
  std::map<std::string, double> values;
  bool partial = false;

  double get(const std::string& key) const;
  void add(const NutrientTotals& other);
};

struct MealNutrients {
  MealSlot slot;
  NutrientTotals totals;
};

struct DayNutrients {
  int dayNumber;
  NutrientTotals totals;
  std::vector<MealNutrients> meals;
};

NutrientTotals itemNutrients(const FoodRecord& food, double grams, const std::vector<std::string>& keys);

std::vector<DayNutrients> computeNutrientTotals(const MealPlan& plan, const FoodIndex& index,
                                                const std::vector<std::string>& keys = coreNutrientKeys());
