#pragma once

#include <optional>
#include <string>
#include <vector>

enum class Sex { Female, Male, Unspecified };

enum class HealthCondition {
  GeneralWellness,
  WeightLoss,
  WeightGain,
  DiabetesType2,
  Hypertension,
  Pregnancy,
  Anaemia,
};

const char* sexName(Sex sex);
std::optional<Sex> sexFromString(const std::string& s);

// Display label, e.g. "Diabetes Type 2".
const char* healthConditionName(HealthCondition condition);
// Accepts the display label, snake_case keys and common spellings ("anemia").
std::optional<HealthCondition> healthConditionFromString(const std::string& s);

// Nutrients the plan should pay particular attention to for a condition.
const std::vector<std::string>& nutrientFocus(HealthCondition condition);

struct ClientProfile {
  std::string name;
  int age = 0;
  Sex sex = Sex::Unspecified;
  std::vector<HealthCondition> conditions;
  double budget = 0.0;  // KSh, ceiling for the whole plan
  int durationDays = 0;
  double kcalGoal = 2000.0;
  std::string preferences;
  std::vector<std::string> exclusions;
};

// True when every word of some exclusion appears in the food name, so
// "beef" excludes "Beef stew" but not "Beetroot".
bool matchesExclusion(const std::string& food, const std::vector<std::string>& exclusions);

// Throws ConfigError on a malformed file or an unknown sex/condition label.
// Range checks happen when the plan request is built.
ClientProfile loadClientProfile(const std::string& path);
