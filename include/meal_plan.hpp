#pragma once

#include <optional>
#include <string>
#include <vector>

enum class MealSlot { Breakfast, Lunch, Dinner, Snack };

const char* mealSlotName(MealSlot slot);
// "breakfast", "Lunch", "snacks" ...
std::optional<MealSlot> mealSlotFromString(const std::string& s);

struct MealItem {
  std::string food;  // as written by the generator
  double grams = 0.0;
  std::string note;
  std::optional<std::string> foodId;  // set once resolved against the index
  double matchScore = 0.0;
  bool unresolved = false;
};

struct Meal {
  MealSlot slot;
  std::string name;
  std::vector<MealItem> items;
};

struct PlanDay {
  int dayNumber;
  std::vector<Meal> meals;  // in slot order
};

struct MealPlan {
  std::vector<PlanDay> days;  // ordered by day number
};
