#pragma once

#include "food_index.hpp"
#include "meal_plan.hpp"
#include "price_catalog.hpp"

#include <optional>
#include <string>
#include <vector>

enum class BudgetVerdict { WithinBudget, OverBudget, PartialUnknown };

// "within-budget", "over-budget", "partial-unknown"
const char* budgetVerdictName(BudgetVerdict verdict);

struct CostedItem {
  MealItem item;
  std::optional<double> price;  // KSh; empty when unresolved or unpriced
};

struct CostedMeal {
  MealSlot slot;
  std::string name;
  std::vector<CostedItem> items;
  double subtotal = 0.0;
  bool partial = false;
};

struct CostedDay {
  int dayNumber;
  std::vector<CostedMeal> meals;
  double subtotal = 0.0;
  bool partial = false;
};

struct CostedPlan {
  std::vector<CostedDay> days;
  double total = 0.0;
  bool partial = false;
  double budget = 0.0;
  double delta = 0.0;  // total - budget
  BudgetVerdict verdict = BudgetVerdict::WithinBudget;
};

// A known cost above the budget is over budget even when some prices are
// missing; otherwise missing prices make the verdict partial-unknown.
BudgetVerdict budgetVerdict(double total, double budget, bool partial);

std::optional<double> itemCost(const MealItem& item, const FoodIndex& index, const PriceCatalog& catalog);

CostedPlan estimatePlanCost(const MealPlan& plan, const FoodIndex& index, const PriceCatalog& catalog, double budget);
