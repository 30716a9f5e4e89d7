#include "nutrient_totals.hpp"

double NutrientTotals::get(const std::string& key) const {
  auto it = values.find(key);
  return it == values.end() ? 0.0 : it->second;
}

void NutrientTotals::add(const NutrientTotals& other) {
  for (const auto& kv : other.values) values[kv.first] += kv.second;
  partial = partial || other.partial;
}

NutrientTotals itemNutrients(const FoodRecord& food, double grams, const std::vector<std::string>& keys) {
  NutrientTotals t;
  double scale = grams / 100.0;
  for (const auto& key : keys) {
    NutrientValue v = food.nutrient(key);
    if (v) t.values[key] = *v * scale;
    else t.partial = true;
  }
  return t;
}

std::vector<DayNutrients> computeNutrientTotals(const MealPlan& plan, const FoodIndex& index,
                                                const std::vector<std::string>& keys) {
  std::vector<DayNutrients> out;
  out.reserve(plan.days.size());
  for (const PlanDay& day : plan.days) {
    DayNutrients dn{day.dayNumber, {}, {}};
    for (const auto& key : keys) dn.totals.values[key] = 0.0;
    for (const Meal& meal : day.meals) {
      MealNutrients mn{meal.slot, {}};
      for (const auto& key : keys) mn.totals.values[key] = 0.0;
      for (const MealItem& item : meal.items) {
        std::optional<FoodRecord> food = item.foodId ? index.findById(*item.foodId) : std::nullopt;
        if (!food) {
          mn.totals.partial = true;
          continue;
        }
        mn.totals.add(itemNutrients(*food, item.grams, keys));
      }
      dn.totals.add(mn.totals);
      dn.meals.push_back(std::move(mn));
    }
    out.push_back(std::move(dn));
  }
  return out;
}
