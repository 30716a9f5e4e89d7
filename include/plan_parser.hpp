#pragma once

#include "meal_plan.hpp"
#include "plan_request.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

struct ParsedPlan {
  nlohmann::json document;
};

struct MalformedOutput {
  std::string reason;
};

using ParseResult = std::variant<ParsedPlan, MalformedOutput>;

struct SchemaViolation {
  std::string reason;
};

using SchemaResult = std::variant<MealPlan, SchemaViolation>;

// Drops commas that directly precede a closing brace or bracket, outside strings.
std::string removeTrailingCommas(const std::string& text);

// First brace-balanced {...} span of text (quotes and escapes respected), or
// nothing when no object is closed.
std::optional<std::string> extractFirstJsonObject(const std::string& text, size_t from = 0);

// Finds the first JSON object in free text. Tolerates a BOM, code fences,
// commentary around the object and trailing commas.
ParseResult parsePlanText(const std::string& raw);

// Checks the parsed document against the request and types it: the day count
// matches, day numbers are unique in 1..n, required slots are present and
// non-empty, and every item has a food name and a positive gram quantity.
SchemaResult validatePlanSchema(const nlohmann::json& document, const PlanRequest& request);
