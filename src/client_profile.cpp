#include "client_profile.hpp"

#include "errors.hpp"
#include "text_normalize.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

const char* sexName(Sex sex) {
  switch (sex) {
    case Sex::Female: return "Female";
    case Sex::Male: return "Male";
    case Sex::Unspecified: return "Unspecified";
  }
  return "Unspecified";
}

std::optional<Sex> sexFromString(const std::string& s) {
  std::string n = normalizeForMatch(s);
  if (n == "female" || n == "f" || n == "woman" || n == "mwanamke") return Sex::Female;
  if (n == "male" || n == "m" || n == "man" || n == "mwanaume") return Sex::Male;
  if (n.empty() || n == "unspecified" || n == "other") return Sex::Unspecified;
  return std::nullopt;
}

const char* healthConditionName(HealthCondition condition) {
  switch (condition) {
    case HealthCondition::GeneralWellness: return "General Wellness";
    case HealthCondition::WeightLoss: return "Weight Loss";
    case HealthCondition::WeightGain: return "Weight Gain";
    case HealthCondition::DiabetesType2: return "Diabetes Type 2";
    case HealthCondition::Hypertension: return "Hypertension";
    case HealthCondition::Pregnancy: return "Pregnancy";
    case HealthCondition::Anaemia: return "Anaemia";
  }
  return "General Wellness";
}

std::optional<HealthCondition> healthConditionFromString(const std::string& s) {
  std::string n = normalizeForMatch(s);
  if (n == "general wellness" || n == "general" || n == "wellness") return HealthCondition::GeneralWellness;
  if (n == "weight loss") return HealthCondition::WeightLoss;
  if (n == "weight gain") return HealthCondition::WeightGain;
  if (n == "diabetes type 2" || n == "type2 diabetes" || n == "type 2 diabetes" || n == "diabetes") {
    return HealthCondition::DiabetesType2;
  }
  if (n == "hypertension" || n == "high blood pressure") return HealthCondition::Hypertension;
  if (n == "pregnancy" || n == "pregnant") return HealthCondition::Pregnancy;
  if (n == "anaemia" || n == "anemia") return HealthCondition::Anaemia;
  return std::nullopt;
}

const std::vector<std::string>& nutrientFocus(HealthCondition condition) {
  static const std::vector<std::string> wellness = {"energy_kcal", "protein_g", "carbohydrate_g"};
  static const std::vector<std::string> weightLoss = {"energy_kcal", "fiber_g", "fat_g", "protein_g"};
  static const std::vector<std::string> weightGain = {"energy_kcal", "protein_g", "fat_g"};
  static const std::vector<std::string> diabetes = {"energy_kcal", "carbohydrate_g", "fiber_g", "protein_g", "fat_g"};
  static const std::vector<std::string> hypertension = {"energy_kcal", "sodium_mg", "potassium_mg", "protein_g"};
  static const std::vector<std::string> pregnancy = {"energy_kcal", "folate_mcg", "iron_mg", "calcium_mg", "protein_g"};
  static const std::vector<std::string> anaemia = {"energy_kcal", "iron_mg", "vit_c_mg", "protein_g"};
  switch (condition) {
    case HealthCondition::GeneralWellness: return wellness;
    case HealthCondition::WeightLoss: return weightLoss;
    case HealthCondition::WeightGain: return weightGain;
    case HealthCondition::DiabetesType2: return diabetes;
    case HealthCondition::Hypertension: return hypertension;
    case HealthCondition::Pregnancy: return pregnancy;
    case HealthCondition::Anaemia: return anaemia;
  }
  return wellness;
}

bool matchesExclusion(const std::string& food, const std::vector<std::string>& exclusions) {
  std::vector<std::string> words = tokenize(normalizeForMatch(food));
  if (words.empty()) return false;
  for (const auto& exclusion : exclusions) {
    std::vector<std::string> needed = tokenize(normalizeForMatch(exclusion));
    if (needed.empty()) continue;
    bool all = std::all_of(needed.begin(), needed.end(), [&](const std::string& w) {
      return std::find(words.begin(), words.end(), w) != words.end();
    });
    if (all) return true;
  }
  return false;
}

ClientProfile loadClientProfile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("cannot read client profile " + path + ": " + e.what());
  }

  ClientProfile profile;
  try {
    if (yaml["name"]) profile.name = yaml["name"].as<std::string>();
    if (yaml["age"]) profile.age = yaml["age"].as<int>();
    if (yaml["sex"]) {
      std::string label = yaml["sex"].as<std::string>();
      std::optional<Sex> sex = sexFromString(label);
      if (!sex) throw ConfigError(path + ": unknown sex '" + label + "'");
      profile.sex = *sex;
    }
    if (yaml["conditions"]) {
      const YAML::Node& list = yaml["conditions"];
      std::vector<std::string> labels;
      if (list.IsSequence()) {
        for (const auto& c : list) labels.push_back(c.as<std::string>());
      } else {
        labels.push_back(list.as<std::string>());
      }
      for (const auto& label : labels) {
        std::optional<HealthCondition> condition = healthConditionFromString(label);
        if (!condition) throw ConfigError(path + ": unknown health condition '" + label + "'");
        profile.conditions.push_back(*condition);
      }
    }
    if (yaml["budget"]) profile.budget = yaml["budget"].as<double>();
    if (yaml["duration_days"]) profile.durationDays = yaml["duration_days"].as<int>();
    if (yaml["kcal_goal"]) profile.kcalGoal = yaml["kcal_goal"].as<double>();
    if (yaml["preferences"]) profile.preferences = yaml["preferences"].as<std::string>();
    if (yaml["exclusions"]) {
      for (const auto& e : yaml["exclusions"]) profile.exclusions.push_back(e.as<std::string>());
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError(path + ": " + e.what());
  }
  if (profile.conditions.empty()) profile.conditions.push_back(HealthCondition::GeneralWellness);
  return profile;
}
