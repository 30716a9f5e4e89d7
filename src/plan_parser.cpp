#include "plan_parser.hpp"

#include "text_normalize.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>

namespace {

void stripBom(std::string& s) {
  if (s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB && (unsigned char)s[2] == 0xBF) {
    s.erase(0, 3);
  }
}

// keeps the text of the first ```...``` block, language tag dropped
void stripCodeFences(std::string& s) {
  size_t a = s.find("```");
  if (a == std::string::npos) return;
  size_t b = s.find("```", a + 3);
  if (b == std::string::npos) {
    s.erase(a, 3);
    return;
  }
  std::string inner = s.substr(a + 3, b - (a + 3));
  size_t nl = inner.find('\n');
  if (nl != std::string::npos && inner.find('{') > nl) inner.erase(0, nl + 1);
  s = inner;
}

// { "meal_plan": { "days": [...] } } -> { "days": [...] }
const nlohmann::json& unwrapPlan(const nlohmann::json& doc) {
  if (doc.is_object() && !doc.contains("days") && doc.size() == 1) {
    const nlohmann::json& inner = doc.begin().value();
    if (inner.is_object() && inner.contains("days")) return inner;
  }
  return doc;
}

// Whole-number day within 1..dayCount. A whole number outside that range
// sets outOfRange; anything else that is not a whole number is no day at all.
std::optional<int> dayNumber(const nlohmann::json& v, int dayCount, bool& outOfRange) {
  outOfRange = false;
  if (v.is_number_unsigned()) {
    std::uint64_t u = v.get<std::uint64_t>();
    if (u < 1 || u > static_cast<std::uint64_t>(dayCount)) {
      outOfRange = true;
      return std::nullopt;
    }
    return static_cast<int>(u);
  }
  if (v.is_number_integer()) {
    std::int64_t i = v.get<std::int64_t>();
    if (i < 1 || i > dayCount) {
      outOfRange = true;
      return std::nullopt;
    }
    return static_cast<int>(i);
  }
  if (v.is_number_float()) {
    double d = v.get<double>();
    if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
    if (d < 1.0 || d > static_cast<double>(dayCount)) {
      outOfRange = true;
      return std::nullopt;
    }
    return static_cast<int>(d);
  }
  return std::nullopt;
}

std::string stringField(const nlohmann::json& obj, const char* a, const char* b = nullptr) {
  if (obj.contains(a) && obj[a].is_string()) return obj[a].get<std::string>();
  if (b && obj.contains(b) && obj[b].is_string()) return obj[b].get<std::string>();
  return std::string();
}

bool parseMeal(const nlohmann::json& value, MealSlot slot, const std::string& where, Meal& meal, std::string& error) {
  meal.slot = slot;
  meal.items.clear();
  if (!value.is_object()) {
    error = where + " is not an object";
    return false;
  }
  meal.name = cleanCellText(stringField(value, "name"));
  if (!value.contains("items") || !value["items"].is_array()) {
    error = where + " has no 'items' array";
    return false;
  }
  const nlohmann::json& items = value["items"];
  for (size_t i = 0; i < items.size(); ++i) {
    const nlohmann::json& it = items[i];
    std::string at = where + " item " + std::to_string(i + 1);
    if (!it.is_object()) {
      error = at + " is not an object";
      return false;
    }
    MealItem item;
    item.food = cleanCellText(stringField(it, "food", "name"));
    if (item.food.empty()) {
      error = at + " has no food name";
      return false;
    }
    if (!it.contains("grams") || !it["grams"].is_number()) {
      error = at + " ('" + item.food + "') needs a numeric 'grams'";
      return false;
    }
    item.grams = it["grams"].get<double>();
    if (!(item.grams > 0.0) || !std::isfinite(item.grams)) {
      error = at + " ('" + item.food + "') has non-positive grams";
      return false;
    }
    item.note = stringField(it, "note");
    meal.items.push_back(std::move(item));
  }
  return true;
}

} // namespace

std::string removeTrailingCommas(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool inStr = false, esc = false;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (inStr) {
      out.push_back(c);
      if (esc) esc = false;
      else if (c == '\\') esc = true;
      else if (c == '"') inStr = false;
      continue;
    }
    if (c == '"') inStr = true;
    if (c == ',') {
      size_t j = text.find_first_not_of(" \t\r\n", i + 1);
      if (j != std::string::npos && (text[j] == '}' || text[j] == ']')) continue;
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::string> extractFirstJsonObject(const std::string& text, size_t from) {
  size_t start = text.find('{', from);
  if (start == std::string::npos) return std::nullopt;
  int depth = 0;
  bool inStr = false, esc = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (inStr) {
      if (esc) esc = false;
      else if (c == '\\') esc = true;
      else if (c == '"') inStr = false;
      continue;
    }
    if (c == '"') inStr = true;
    else if (c == '{') ++depth;
    else if (c == '}' && --depth == 0) return text.substr(start, i - start + 1);
  }
  return std::nullopt;
}

ParseResult parsePlanText(const std::string& raw) {
  std::string text = raw;
  stripBom(text);
  stripCodeFences(text);
  text = trim(text);
  if (text.empty()) return MalformedOutput{"empty output"};

  std::string firstError;
  size_t from = 0;
  while (true) {
    size_t start = text.find('{', from);
    if (start == std::string::npos) break;
    std::optional<std::string> candidate = extractFirstJsonObject(text, start);
    if (!candidate) {
      if (firstError.empty()) firstError = "unterminated JSON object";
      break;
    }
    nlohmann::json doc = nlohmann::json::parse(removeTrailingCommas(*candidate), nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) return ParsedPlan{std::move(doc)};
    if (firstError.empty()) firstError = "invalid JSON object at offset " + std::to_string(start);
    from = start + 1;
  }
  return MalformedOutput{firstError.empty() ? "no JSON object in output" : firstError};
}

SchemaResult validatePlanSchema(const nlohmann::json& document, const PlanRequest& request) {
  const nlohmann::json& doc = unwrapPlan(document);
  if (!doc.is_object() || !doc.contains("days") || !doc["days"].is_array()) {
    return SchemaViolation{"top-level 'days' array missing"};
  }
  const nlohmann::json& days = doc["days"];
  if (static_cast<int>(days.size()) != request.dayCount) {
    return SchemaViolation{"expected " + std::to_string(request.dayCount) + " day(s), got " + std::to_string(days.size())};
  }

  MealPlan plan;
  std::set<int> seen;
  for (size_t d = 0; d < days.size(); ++d) {
    const nlohmann::json& day = days[d];
    std::string where = "day entry " + std::to_string(d + 1);
    if (!day.is_object()) return SchemaViolation{where + " is not an object"};
    bool outOfRange = false;
    std::optional<int> number = day.contains("day") ? dayNumber(day["day"], request.dayCount, outOfRange) : std::nullopt;
    if (outOfRange) {
      return SchemaViolation{"day " + day["day"].dump() + " outside 1.." + std::to_string(request.dayCount)};
    }
    if (!number) return SchemaViolation{where + " has no integer 'day'"};
    if (!seen.insert(*number).second) return SchemaViolation{"day " + std::to_string(*number) + " appears twice"};
    where = "day " + std::to_string(*number);

    PlanDay planDay{*number, {}};
    if (!day.contains("meals")) return SchemaViolation{where + " has no 'meals'"};
    const nlohmann::json& meals = day["meals"];
    std::vector<std::pair<std::string, const nlohmann::json*>> entries;
    if (meals.is_object()) {
      for (auto it = meals.begin(); it != meals.end(); ++it) entries.emplace_back(it.key(), &it.value());
    } else if (meals.is_array()) {
      for (const auto& m : meals) {
        std::string label = m.is_object() ? stringField(m, "slot", "type") : std::string();
        entries.emplace_back(label, &m);
      }
    } else {
      return SchemaViolation{where + " 'meals' is neither an object nor an array"};
    }

    std::set<MealSlot> slotsSeen;
    for (const auto& entry : entries) {
      std::optional<MealSlot> slot = mealSlotFromString(entry.first);
      if (!slot) return SchemaViolation{where + " has unknown meal slot '" + entry.first + "'"};
      if (!slotsSeen.insert(*slot).second) return SchemaViolation{where + " repeats " + mealSlotName(*slot)};
      Meal meal;
      std::string error;
      if (!parseMeal(*entry.second, *slot, where + " " + mealSlotName(*slot), meal, error)) return SchemaViolation{error};
      planDay.meals.push_back(std::move(meal));
    }

    for (MealSlot required : request.slots) {
      if (request.allowEmptySlots) break;
      auto it = std::find_if(planDay.meals.begin(), planDay.meals.end(),
                             [required](const Meal& m) { return m.slot == required; });
      if (it == planDay.meals.end()) return SchemaViolation{where + " is missing " + mealSlotName(required)};
      if (it->items.empty()) return SchemaViolation{where + " " + mealSlotName(required) + " has no items"};
    }

    std::sort(planDay.meals.begin(), planDay.meals.end(),
              [](const Meal& a, const Meal& b) { return static_cast<int>(a.slot) < static_cast<int>(b.slot); });
    plan.days.push_back(std::move(planDay));
  }

  std::sort(plan.days.begin(), plan.days.end(), [](const PlanDay& a, const PlanDay& b) { return a.dayNumber < b.dayNumber; });
  return plan;
}
