#include "meal_plan.hpp"

#include "text_normalize.hpp"

const char* mealSlotName(MealSlot slot) {
  switch (slot) {
    case MealSlot::Breakfast: return "breakfast";
    case MealSlot::Lunch: return "lunch";
    case MealSlot::Dinner: return "dinner";
    case MealSlot::Snack: return "snack";
  }
  return "snack";
}

std::optional<MealSlot> mealSlotFromString(const std::string& s) {
  std::string n = normalizeForMatch(s);
  if (n == "breakfast" || n == "kiamsha kinywa") return MealSlot::Breakfast;
  if (n == "lunch" || n == "chakula cha mchana") return MealSlot::Lunch;
  if (n == "dinner" || n == "supper" || n == "chakula cha jioni") return MealSlot::Dinner;
  if (n == "snack" || n == "snacks" || n == "vitafunio") return MealSlot::Snack;
  return std::nullopt;
}
