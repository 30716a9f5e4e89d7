#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// KFCT 2018 food groups. The source food code starts with the group letter.
enum class FoodGroup {
  Cereals,
  StarchyRoots,
  Legumes,
  NutsSeeds,
  Vegetables,
  Fruits,
  MeatPoultry,
  Fish,
  MilkEggs,
  OilsFats,
  Beverages,
  SpicesCondiments,
  Miscellaneous,
  InfantFoods,
  SpecialDietary,
};

const std::vector<FoodGroup>& allFoodGroups();

// Display name, e.g. "Cereals and their products".
const std::string& foodGroupName(FoodGroup group);

// Stable machine key used in the dataset file, e.g. "cereals".
const std::string& foodGroupKey(FoodGroup group);

// Short labels and Swahili names that also denote the group.
const std::vector<std::string>& foodGroupAliases(FoodGroup group);

std::optional<FoodGroup> foodGroupFromKey(const std::string& key);

// "A001" -> Cereals. Empty when the first letter is not a known chapter.
std::optional<FoodGroup> foodGroupFromCode(const std::string& code);

// std::nullopt means "not available" (trace, not determined, missing). It is
// never the same thing as 0.
using NutrientValue = std::optional<double>;

// Unit of a per-100 g nutrient key ("energy_kcal" -> "kcal", "iron_mg" -> "mg").
std::string nutrientUnit(const std::string& key);


// energy_kcal, protein_g, fat_g, carbohydrate_g, fiber_g
const std::vector<std::string>& coreNutrientKeys();

struct FoodRecord {
  std::string id;
  std::string code;
  std::string nameEn;
  std::string nameSw;
  FoodGroup group = FoodGroup::Miscellaneous;

  NutrientValue energy;        // kcal / 100 g
  NutrientValue protein;       // g / 100 g
  NutrientValue fat;           // g / 100 g
  NutrientValue carbohydrate;  // g / 100 g
  NutrientValue fiber;         // g / 100 g
  std::map<std::string, NutrientValue> micronutrients;

  // Looks up core and micro nutrients by their dataset key.
  NutrientValue nutrient(const std::string& key) const;
  // Keys other than the five core ones are stored as micronutrients.
  void setNutrient(const std::string& key, NutrientValue value);
};

bool operator==(const FoodRecord& a, const FoodRecord& b);
