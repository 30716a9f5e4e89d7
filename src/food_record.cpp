#include "food_record.hpp"

#include <cctype>
#include <stdexcept>

namespace {

struct GroupInfo {
  FoodGroup group;
  char letter;
  std::string key;
  std::string name;
  std::vector<std::string> aliases;
};

const std::vector<GroupInfo>& groupTable() {
  static const std::vector<GroupInfo> table = {
    {FoodGroup::Cereals, 'A', "cereals", "Cereals and their products",
      {"cereals", "cereal products", "nafaka"}},
    {FoodGroup::StarchyRoots, 'B', "starchy_roots", "Starchy roots, tubers and their products",
      {"starchy roots", "roots and tubers", "tubers", "mizizi"}},
    {FoodGroup::Legumes, 'C', "legumes", "Legumes and their products",
      {"legumes", "pulses", "kunde"}},
    {FoodGroup::NutsSeeds, 'D', "nuts_seeds", "Nuts, seeds and their products",
      {"nuts and seeds", "nuts", "seeds", "njugu"}},
    {FoodGroup::Vegetables, 'E', "vegetables", "Vegetables and their products",
      {"vegetables", "mboga"}},
    {FoodGroup::Fruits, 'F', "fruits", "Fruits and their products",
      {"fruits", "matunda"}},
    {FoodGroup::MeatPoultry, 'G', "meat_poultry", "Meat, poultry and their products",
      {"meat", "meat and poultry", "poultry", "nyama"}},
    {FoodGroup::Fish, 'H', "fish", "Fish, other aquatic animals and their products",
      {"fish", "fish and seafood", "samaki"}},
    {FoodGroup::MilkEggs, 'J', "milk_eggs", "Milk, milk products and eggs",
      {"milk", "milk and eggs", "dairy", "eggs", "maziwa"}},
    {FoodGroup::OilsFats, 'K', "oils_fats", "Oils and fats",
      {"oils", "fats", "mafuta"}},
    {FoodGroup::Beverages, 'L', "beverages", "Beverages",
      {"drinks", "vinywaji"}},
    {FoodGroup::SpicesCondiments, 'M', "spices_condiments", "Spices and condiments",
      {"spices", "condiments", "viungo"}},
    {FoodGroup::Miscellaneous, 'N', "miscellaneous", "Miscellaneous",
      {"misc", "other"}},
    {FoodGroup::InfantFoods, 'P', "infant_foods", "Infant foods",
      {"baby foods", "infant formula"}},
    {FoodGroup::SpecialDietary, 'S', "special_dietary", "Foods for special dietary use",
      {"special dietary", "dietary foods"}},
  };
  return table;
}

const GroupInfo& infoFor(FoodGroup group) {
  for (const auto& info : groupTable()) {
    if (info.group == group) return info;
  }
  throw std::logic_error("unknown food group");
}

} // namespace

const std::vector<FoodGroup>& allFoodGroups() {
  static const std::vector<FoodGroup> groups = [] {
    std::vector<FoodGroup> out;
    for (const auto& info : groupTable()) out.push_back(info.group);
    return out;
  }();
  return groups;
}

const std::string& foodGroupName(FoodGroup group) {
  return infoFor(group).name;
}

const std::string& foodGroupKey(FoodGroup group) {
  return infoFor(group).key;
}

const std::vector<std::string>& foodGroupAliases(FoodGroup group) {
  return infoFor(group).aliases;
}

std::optional<FoodGroup> foodGroupFromKey(const std::string& key) {
  for (const auto& info : groupTable()) {
    if (info.key == key) return info.group;
  }
  return std::nullopt;
}

std::optional<FoodGroup> foodGroupFromCode(const std::string& code) {
  if (code.empty()) return std::nullopt;
  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(code[0])));
  for (const auto& info : groupTable()) {
    if (info.letter == letter) return info.group;
  }
  return std::nullopt;
}

std::string nutrientUnit(const std::string& key) {
  if (key == "energy_kcal") return "kcal";
  if (key == "energy_kj") return "kJ";
  size_t pos = key.rfind('_');
  if (pos == std::string::npos) return "";
  std::string suffix = key.substr(pos + 1);
  if (suffix == "g" || suffix == "mg" || suffix == "mcg") return suffix;
  return "";
}

const std::vector<std::string>& coreNutrientKeys() {
  static const std::vector<std::string> keys = {"energy_kcal", "protein_g", "fat_g", "carbohydrate_g", "fiber_g"};
  return keys;
}

NutrientValue FoodRecord::nutrient(const std::string& key) const {
  if (key == "energy_kcal") return energy;
  if (key == "protein_g") return protein;
  if (key == "fat_g") return fat;
  if (key == "carbohydrate_g") return carbohydrate;
  if (key == "fiber_g") return fiber;
  auto it = micronutrients.find(key);
  if (it == micronutrients.end()) return std::nullopt;
  return it->second;
}

void FoodRecord::setNutrient(const std::string& key, NutrientValue value) {
  if (key == "energy_kcal") energy = value;
  else if (key == "protein_g") protein = value;
  else if (key == "fat_g") fat = value;
  else if (key == "carbohydrate_g") carbohydrate = value;
  else if (key == "fiber_g") fiber = value;
  else micronutrients[key] = value;
}

namespace {

// an absent key and a not-available value mean the same thing
bool sameMicronutrients(const FoodRecord& a, const FoodRecord& b) {
  for (const auto& kv : a.micronutrients) {
    if (b.nutrient(kv.first) != kv.second) return false;
  }
  for (const auto& kv : b.micronutrients) {
    if (a.nutrient(kv.first) != kv.second) return false;
  }
  return true;
}

} // namespace

bool operator==(const FoodRecord& a, const FoodRecord& b) {
  return a.id == b.id && a.code == b.code && a.nameEn == b.nameEn && a.nameSw == b.nameSw &&
         a.group == b.group && a.energy == b.energy && a.protein == b.protein && a.fat == b.fat &&
         a.carbohydrate == b.carbohydrate && a.fiber == b.fiber && sameMicronutrients(a, b);
}
