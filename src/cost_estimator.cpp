#include "cost_estimator.hpp"

const char* budgetVerdictName(BudgetVerdict verdict) {
  switch (verdict) {
    case BudgetVerdict::WithinBudget: return "within-budget";
    case BudgetVerdict::OverBudget: return "over-budget";
    case BudgetVerdict::PartialUnknown: return "partial-unknown";
  }
  return "partial-unknown";
}

BudgetVerdict budgetVerdict(double total, double budget, bool partial) {
  if (total > budget) return BudgetVerdict::OverBudget;
  if (partial) return BudgetVerdict::PartialUnknown;
  return BudgetVerdict::WithinBudget;
}

std::optional<double> itemCost(const MealItem& item, const FoodIndex& index, const PriceCatalog& catalog) {
  if (item.unresolved || !item.foodId) return std::nullopt;
  std::optional<FoodRecord> food = index.findById(*item.foodId);
  if (!food) return std::nullopt;
  return catalog.costFor(*food, item.grams);
}

CostedPlan estimatePlanCost(const MealPlan& plan, const FoodIndex& index, const PriceCatalog& catalog, double budget) {
  CostedPlan costed;
  costed.budget = budget;
  for (const PlanDay& day : plan.days) {
    CostedDay cd{day.dayNumber, {}, 0.0, false};
    for (const Meal& meal : day.meals) {
      CostedMeal cm{meal.slot, meal.name, {}, 0.0, false};
      for (const MealItem& item : meal.items) {
        CostedItem ci{item, itemCost(item, index, catalog)};
        if (ci.price) cm.subtotal += *ci.price;
        else cm.partial = true;
        cm.items.push_back(std::move(ci));
      }
      cd.subtotal += cm.subtotal;
      cd.partial = cd.partial || cm.partial;
      cd.meals.push_back(std::move(cm));
    }
    costed.total += cd.subtotal;
    costed.partial = costed.partial || cd.partial;
    costed.days.push_back(std::move(cd));
  }
  costed.delta = costed.total - budget;
  costed.verdict = budgetVerdict(costed.total, budget, costed.partial);
  return costed;
}
