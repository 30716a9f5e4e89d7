#include "plan_request.hpp"

#include "errors.hpp"

#include <cmath>
#include <sstream>

namespace {

std::string formatAmount(double v) {
  std::ostringstream ss;
  if (std::floor(v) == v) ss << static_cast<long long>(v);
  else ss << v;
  return ss.str();
}

std::string joinConditions(const std::vector<HealthCondition>& conditions) {
  std::string out;
  for (size_t i = 0; i < conditions.size(); ++i) {
    if (i) out += ", ";
    out += healthConditionName(conditions[i]);
  }
  return out;
}

std::string joinFocus(const std::vector<HealthCondition>& conditions) {
  std::vector<std::string> keys;
  for (HealthCondition c : conditions) {
    for (const auto& k : nutrientFocus(c)) {
      bool seen = false;
      for (const auto& existing : keys) seen = seen || existing == k;
      if (!seen) keys.push_back(k);
    }
  }
  std::string out;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (i) out += ", ";
    out += keys[i];
  }
  return out;
}

std::string joinSlots(const std::vector<MealSlot>& slots) {
  std::string out;
  for (size_t i = 0; i < slots.size(); ++i) {
    if (i) out += ", ";
    out += mealSlotName(slots[i]);
  }
  return out;
}

std::string exampleStructure(const std::vector<MealSlot>& slots) {
  std::string out = "{\n  \"days\": [\n    {\n      \"day\": 1,\n      \"meals\": {\n";
  for (size_t i = 0; i < slots.size(); ++i) {
    out += "        \"";
    out += mealSlotName(slots[i]);
    out += "\": {\"name\": \"...\", \"items\": [{\"food\": \"...\", \"grams\": 150, \"note\": \"...\"}]}";
    out += i + 1 < slots.size() ? ",\n" : "\n";
  }
  out += "      }\n    }\n  ]\n}";
  return out;
}

} // namespace

nlohmann::json planOutputSchema(int dayCount, const std::vector<MealSlot>& slots, bool allowEmptySlots) {
  nlohmann::json item = {
    {"type", "object"},
    {"required", {"food", "grams"}},
    {"properties", {
      {"food", {{"type", "string"}, {"minLength", 1}}},
      {"grams", {{"type", "number"}, {"exclusiveMinimum", 0}}},
      {"note", {{"type", "string"}}},
    }},
  };
  nlohmann::json meal = {
    {"type", "object"},
    {"required", {"name", "items"}},
    {"properties", {
      {"name", {{"type", "string"}}},
      {"items", {{"type", "array"}, {"minItems", allowEmptySlots ? 0 : 1}, {"items", item}}},
    }},
  };
  nlohmann::json slotProps = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (MealSlot s : slots) {
    slotProps[mealSlotName(s)] = meal;
    if (!allowEmptySlots) required.push_back(mealSlotName(s));
  }
  nlohmann::json day = {
    {"type", "object"},
    {"required", {"day", "meals"}},
    {"properties", {
      {"day", {{"type", "integer"}, {"minimum", 1}, {"maximum", dayCount}}},
      {"meals", {{"type", "object"}, {"required", required}, {"properties", slotProps}}},
    }},
  };
  return {
    {"type", "object"},
    {"required", nlohmann::json::array({"days"})},
    {"properties", {
      {"days", {{"type", "array"}, {"minItems", dayCount}, {"maxItems", dayCount}, {"items", day}}},
    }},
  };
}

std::string buildFoodList(const FoodIndex& index, const std::vector<std::string>& exclusions, size_t maxChars) {
  std::string out;
  for (FoodGroup g : allFoodGroups()) {
    std::string line;
    for (const FoodRecord& r : index.filterByGroup(g)) {
      if (matchesExclusion(r.nameEn, exclusions) || matchesExclusion(r.nameSw, exclusions)) continue;
      std::string entry = r.nameEn;
      if (!r.nameSw.empty()) entry += " (" + r.nameSw + ")";
      std::string candidate = line.empty() ? foodGroupName(g) + ": " + entry : line + ", " + entry;
      size_t projected = out.size() + (out.empty() ? 0 : 1) + candidate.size();
      if (projected > maxChars) {
        if (!line.empty()) out += (out.empty() ? "" : "\n") + line;
        return out;
      }
      line = std::move(candidate);
    }
    if (!line.empty()) out += (out.empty() ? "" : "\n") + line;
  }
  return out;
}

PlanRequest buildPlanRequest(const ClientProfile& profile, const GenerationOptions& options, const FoodIndex& index) {
  if (profile.durationDays < 1 || profile.durationDays > 7) {
    throw InvalidPlanRequest("duration must be between 1 and 7 days, got " + std::to_string(profile.durationDays));
  }
  if (!(profile.budget > 0.0)) throw InvalidPlanRequest("budget must be positive, got " + formatAmount(profile.budget));
  if (profile.age <= 0) throw InvalidPlanRequest("age must be positive, got " + std::to_string(profile.age));
  if (!(profile.kcalGoal > 0.0)) throw InvalidPlanRequest("daily energy goal must be positive");
  if (options.mealSlots.empty()) throw InvalidPlanRequest("at least one meal slot is required");
  if (options.maxRetries < 0) throw InvalidPlanRequest("max_retries must not be negative");
  if (options.model.empty()) throw InvalidPlanRequest("no generation model configured");

  PlanRequest request;
  request.model = options.model;
  request.dayCount = profile.durationDays;
  request.slots = options.mealSlots;
  request.allowEmptySlots = options.allowEmptySlots;
  request.budget = profile.budget;
  request.kcalGoal = profile.kcalGoal;
  request.exclusions = profile.exclusions;
  request.temperature = options.temperature;
  request.maxRetries = options.maxRetries;
  request.timeout = options.timeout;
  request.outputSchema = planOutputSchema(profile.durationDays, options.mealSlots, options.allowEmptySlots);

  const std::string days = std::to_string(profile.durationDays);
  std::string p;
  p.reserve(4096 + options.maxFoodListChars);
  p += "You are an experienced " + options.culturalFraming + " registered dietitian nutritionist.\n";
  p += "Create a realistic, culturally appropriate and affordable " + days + "-day meal plan for the client below.\n\n";
  p += "CLIENT DETAILS:\n";
  if (!profile.name.empty()) p += "- Name: " + profile.name + "\n";
  p += "- Age: " + std::to_string(profile.age) + "\n";
  p += std::string("- Sex: ") + sexName(profile.sex) + "\n";
  p += "- Health goal/condition: " + joinConditions(profile.conditions) + "\n";
  p += "- Daily energy target: ~" + formatAmount(profile.kcalGoal) + " kcal\n";
  p += "- Budget for the whole plan: KSh " + formatAmount(profile.budget) + "\n";
  p += "- Preferences: " + (profile.preferences.empty() ? std::string("none") : profile.preferences) + "\n";
  if (!profile.exclusions.empty()) {
    p += "- Never use: ";
    for (size_t i = 0; i < profile.exclusions.size(); ++i) p += (i ? ", " : "") + profile.exclusions[i];
    p += "\n";
  }
  p += "\nINSTRUCTIONS:\n";
  p += "1. Use ONLY foods from this list. Do not invent foods.\n<food_list>\n";
  p += buildFoodList(index, profile.exclusions, options.maxFoodListChars);
  p += "\n</food_list>\n";
  p += "2. Meals must be practical and common in " + options.culturalFraming + " households.\n";
  p += "3. Plan exactly " + days + " day(s), numbered 1 to " + days + ". Each day has these meals: " +
       joinSlots(options.mealSlots) + ".\n";
  p += "4. Each meal lists its foods as items with the food name from the list and a quantity in grams (a number).\n";
  p += "5. Pay particular attention to: " + joinFocus(profile.conditions) + ".\n";
  p += "6. Output ONLY one valid JSON object with this structure, no text before or after it:\n";
  p += exampleStructure(options.mealSlots);
  p += "\nJSON schema:\n";
  p += request.outputSchema.dump();
  p += "\n";

  request.basePrompt = p;
  request.prompt = p;
  return request;
}

PlanRequest withCorrectiveHint(const PlanRequest& request, const std::string& hint, int attempt) {
  PlanRequest next = request;
  next.attempt = attempt;
  next.correctiveHint = hint;
  next.prompt = request.basePrompt;
  next.prompt += "\nYOUR PREVIOUS ANSWER WAS REJECTED: " + hint + "\n";
  next.prompt += "Return the complete corrected JSON object only.\n";
  return next;
}
