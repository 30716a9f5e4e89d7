#pragma once

#include "client_profile.hpp"
#include "food_index.hpp"
#include "meal_plan.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

struct GenerationOptions {
  std::string model = "llama3";
  std::string culturalFraming = "Kenyan";
  int maxRetries = 2;  // retries after the first attempt
  std::vector<MealSlot> mealSlots = {MealSlot::Breakfast, MealSlot::Lunch, MealSlot::Dinner};
  bool allowEmptySlots = false;
  double temperature = 0.2;
  size_t maxFoodListChars = 3000;
  std::chrono::milliseconds timeout{120000};  // per generation call
};

// Everything one generation call needs. Built once per plan; retries derive a
// copy through withCorrectiveHint().
struct PlanRequest {
  std::string model;
  std::string prompt;
  std::string basePrompt;  // prompt without any corrective hint
  nlohmann::json outputSchema;
  int dayCount = 0;
  std::vector<MealSlot> slots;
  bool allowEmptySlots = false;
  double budget = 0.0;
  double kcalGoal = 0.0;
  std::vector<std::string> exclusions;
  double temperature = 0.2;
  int maxRetries = 0;
  std::chrono::milliseconds timeout{120000};
  int attempt = 1;
  std::string correctiveHint;
};

// JSON Schema of the object the generator must return.
nlohmann::json planOutputSchema(int dayCount, const std::vector<MealSlot>& slots, bool allowEmptySlots);

// Food names offered to the generator, one line per group, cut at the last
// whole entry that fits in maxChars. Excluded foods are left out.
std::string buildFoodList(const FoodIndex& index, const std::vector<std::string>& exclusions, size_t maxChars);

// Throws InvalidPlanRequest when the duration is outside [1, 7], the budget,
// age or energy goal is not positive, no meal slot is configured or the
// retry count is negative.
PlanRequest buildPlanRequest(const ClientProfile& profile, const GenerationOptions& options, const FoodIndex& index);

PlanRequest withCorrectiveHint(const PlanRequest& request, const std::string& hint, int attempt);
