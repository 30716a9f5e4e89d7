#include "plan_validator.hpp"

#include "cost_estimator.hpp"
#include "errors.hpp"
#include "plan_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace {

std::string formatWhole(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f", v);
  return buf;
}

std::string listNames(const std::vector<std::string>& names, size_t limit = 5) {
  std::string out;
  for (size_t i = 0; i < names.size() && i < limit; ++i) {
    if (i) out += ", ";
    out += "'" + names[i] + "'";
  }
  if (names.size() > limit) out += " and " + std::to_string(names.size() - limit) + " more";
  return out;
}

struct Outcome {
  ValidationState failedAt;
  std::string stage;
  std::string diagnostic;
};

} // namespace

const char* validationStateName(ValidationState state) {
  switch (state) {
    case ValidationState::Raw: return "raw";
    case ValidationState::Parsed: return "parsed";
    case ValidationState::SchemaValid: return "schema-valid";
    case ValidationState::ConstraintValid: return "constraint-valid";
    case ValidationState::Accepted: return "accepted";
    case ValidationState::Retry: return "retry";
    case ValidationState::Rejected: return "rejected";
  }
  return "raw";
}

void resolvePlanItems(MealPlan& plan, const FoodIndex& index) {
  for (PlanDay& day : plan.days) {
    for (Meal& meal : day.meals) {
      for (MealItem& item : meal.items) {
        item.foodId.reset();
        item.matchScore = 0.0;
        item.unresolved = false;
        std::optional<FoodRecord> hit = index.lookupExact(item.food, Language::English);
        if (!hit) hit = index.lookupExact(item.food, Language::Swahili);
        if (hit) {
          item.foodId = hit->id;
          item.matchScore = 1.0;
          continue;
        }
        std::vector<FuzzyMatch> fuzzy = index.lookupFuzzy(item.food, Language::Any, 1);
        if (!fuzzy.empty()) {
          item.foodId = fuzzy.front().record.id;
          item.matchScore = fuzzy.front().score;
          spdlog::debug("Validator: '{}' matched '{}' ({:.2f})", item.food, fuzzy.front().record.nameEn,
                        fuzzy.front().score);
        } else {
          item.unresolved = true;
        }
      }
    }
  }
}

std::optional<ConstraintInvalid> checkConstraints(const MealPlan& plan, const PlanRequest& request,
                                                  const FoodIndex& index, const PriceCatalog& catalog,
                                                  const ValidatorOptions& options) {
  size_t total = 0;
  std::vector<std::string> unresolved;
  std::vector<std::string> excluded;
  for (const PlanDay& day : plan.days) {
    for (const Meal& meal : day.meals) {
      for (const MealItem& item : meal.items) {
        total++;
        if (item.unresolved) unresolved.push_back(item.food);
        bool hit = matchesExclusion(item.food, request.exclusions);
        if (!hit && item.foodId) {
          std::optional<FoodRecord> food = index.findById(*item.foodId);
          hit = food && (matchesExclusion(food->nameEn, request.exclusions) ||
                         matchesExclusion(food->nameSw, request.exclusions));
        }
        if (hit) excluded.push_back(item.food);
      }
    }
  }

  if (total > 0 && static_cast<double>(unresolved.size()) / total > options.unresolvedTolerance) {
    return ConstraintInvalid{"unresolved-items", std::to_string(unresolved.size()) + " of " + std::to_string(total) +
                             " item(s) are not in the food list: " + listNames(unresolved)};
  }
  if (!excluded.empty()) {
    return ConstraintInvalid{"excluded-food", "the client excludes " + listNames(excluded)};
  }

  if (request.dayCount > 0) {
    double dayLimit = options.dayCostFactor * request.budget / request.dayCount;
    CostedPlan costed = estimatePlanCost(plan, index, catalog, request.budget);
    for (const CostedDay& day : costed.days) {
      if (day.subtotal > dayLimit) {
        return ConstraintInvalid{"day-cost", "day " + std::to_string(day.dayNumber) + " costs KSh " +
                                 formatWhole(day.subtotal) + ", above the daily limit of KSh " + formatWhole(dayLimit)};
      }
    }
  }

  const double low = options.minEnergyRatio * request.kcalGoal;
  const double high = options.maxEnergyRatio * request.kcalGoal;
  for (const PlanDay& day : plan.days) {
    double kcal = 0.0;
    bool anyKnown = false;
    for (const Meal& meal : day.meals) {
      for (const MealItem& item : meal.items) {
        if (!item.foodId) continue;
        std::optional<FoodRecord> food = index.findById(*item.foodId);
        if (!food || !food->energy) continue;
        kcal += *food->energy * item.grams / 100.0;
        anyKnown = true;
      }
    }
    // a day with no resolvable energy data cannot be judged
    if (!anyKnown) continue;
    if (kcal < low || kcal > high) {
      return ConstraintInvalid{"day-energy", "day " + std::to_string(day.dayNumber) + " provides about " +
                               formatWhole(kcal) + " kcal, outside " + formatWhole(low) + "-" + formatWhole(high) +
                               " kcal for a goal of " + formatWhole(request.kcalGoal) + " kcal"};
    }
  }
  return std::nullopt;
}

PlanValidator::PlanValidator(std::shared_ptr<const FoodIndex> index, const PriceCatalog& catalog,
                             PlanGenerationClient& client, ValidatorOptions options)
  : index_(std::move(index)), catalog_(catalog), client_(client), options_(options) {
  if (!index_) throw DatasetError("no food index loaded");
}

AcceptedPlan PlanValidator::run(const PlanRequest& request) {
  using clock = std::chrono::steady_clock;
  std::vector<StateTransition> trace;
  auto transition = [&trace](int attempt, ValidationState from, ValidationState to, std::string detail = std::string()) {
    trace.push_back(StateTransition{attempt, from, to, std::move(detail)});
  };
  if (request.maxRetries < 0) throw InvalidPlanRequest("max_retries must not be negative");
  const int maxAttempts = request.maxRetries + 1;
  const auto budget = request.timeout * maxAttempts;
  const auto deadline = clock::now() + budget;

  PlanRequest current = request;
  Outcome last{ValidationState::Raw, "", ""};
  for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (remaining.count() <= 0) {
      throw GenerationTimeout("no accepted meal plan within " + std::to_string(budget.count()) + " ms after " +
                              std::to_string(attempt - 1) + " attempt(s)" +
                              (last.diagnostic.empty() ? "" : "; last rejection at " + last.stage + ": " + last.diagnostic));
    }
    current.timeout = std::min(request.timeout, remaining);
    if (attempt > 1) transition(attempt, ValidationState::Retry, ValidationState::Raw);

    std::string raw = client_.generate(current);

    std::optional<Outcome> failure;
    MealPlan plan;
    ParseResult parsed = parsePlanText(raw);
    if (auto* bad = std::get_if<MalformedOutput>(&parsed)) {
      failure = Outcome{ValidationState::Raw, "parse", bad->reason};
    } else {
      transition(attempt, ValidationState::Raw, ValidationState::Parsed);
      SchemaResult typed = validatePlanSchema(std::get<ParsedPlan>(parsed).document, current);
      if (auto* violation = std::get_if<SchemaViolation>(&typed)) {
        failure = Outcome{ValidationState::Parsed, "schema", violation->reason};
      } else {
        transition(attempt, ValidationState::Parsed, ValidationState::SchemaValid);
        plan = std::move(std::get<MealPlan>(typed));
        resolvePlanItems(plan, *index_);
        std::optional<ConstraintInvalid> invalid = checkConstraints(plan, current, *index_, catalog_, options_);
        if (invalid) failure = Outcome{ValidationState::SchemaValid, invalid->constraint, invalid->detail};
      }
    }

    if (!failure) {
      transition(attempt, ValidationState::SchemaValid, ValidationState::ConstraintValid);
      transition(attempt, ValidationState::ConstraintValid, ValidationState::Accepted);
      AcceptedPlan accepted;
      accepted.attempts = attempt;
      accepted.retries = attempt - 1;
      for (const PlanDay& day : plan.days) {
        for (const Meal& meal : day.meals) {
          for (const MealItem& item : meal.items) {
            if (item.unresolved) accepted.unresolved.push_back(item.food);
          }
        }
      }
      accepted.plan = std::move(plan);
      accepted.trace = std::move(trace);
      spdlog::info("Validator: plan accepted on attempt {} of {} ({} unresolved item(s))", attempt, maxAttempts,
                   accepted.unresolved.size());
      return accepted;
    }

    last = *failure;
    if (attempt < maxAttempts) {
      transition(attempt, last.failedAt, ValidationState::Retry, last.stage + ": " + last.diagnostic);
      spdlog::warn("Validator: attempt {} of {} rejected at {}: {}", attempt, maxAttempts, last.stage, last.diagnostic);
      current = withCorrectiveHint(request, last.diagnostic, attempt + 1);
    } else {
      transition(attempt, last.failedAt, ValidationState::Rejected, last.stage + ": " + last.diagnostic);
      spdlog::error("Validator: plan rejected after {} attempt(s) at {}: {}", attempt, last.stage, last.diagnostic);
    }
  }
  throw PlanRejected(maxAttempts, last.stage, last.diagnostic, std::move(trace));
}
