#pragma once

#include "errors.hpp"
#include "food_index.hpp"
#include "generation_client.hpp"
#include "meal_plan.hpp"
#include "plan_request.hpp"
#include "price_catalog.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ValidationState { Raw, Parsed, SchemaValid, ConstraintValid, Accepted, Retry, Rejected };

const char* validationStateName(ValidationState state);

struct StateTransition {
  int attempt;
  ValidationState from;
  ValidationState to;
  std::string detail;
};

struct ValidatorOptions {
  double unresolvedTolerance = 0.10;  // max fraction of unresolved items
  double dayCostFactor = 1.5;         // day cost ceiling, as a multiple of budget / days
  double minEnergyRatio = 0.4;        // of the daily energy goal
  double maxEnergyRatio = 2.5;
};

// A plan that parsed and typed fine but breaks a domain constraint.
struct ConstraintInvalid {
  std::string constraint;
  std::string detail;
};

struct AcceptedPlan {
  MealPlan plan;
  int attempts = 0;
  int retries = 0;
  std::vector<std::string> unresolved;  // food names kept with the unresolved flag
  std::vector<StateTransition> trace;
};

// Resolves every item against the index: exact English name, exact Swahili
// name, then the best fuzzy candidate. Items with no match are flagged.
// GenerationConstraintFailure with the state trace of the rejected run.
class PlanRejected : public GenerationConstraintFailure {
public:
  PlanRejected(int attempts, std::string stage, std::string diagnostic, std::vector<StateTransition> trace)
    : GenerationConstraintFailure(attempts, std::move(stage), std::move(diagnostic)), trace_(std::move(trace)) {}

  const std::vector<StateTransition>& trace() const { return trace_; }

private:
  std::vector<StateTransition> trace_;
};

void resolvePlanItems(MealPlan& plan, const FoodIndex& index);

std::optional<ConstraintInvalid> checkConstraints(const MealPlan& plan, const PlanRequest& request,
                                                  const FoodIndex& index, const PriceCatalog& catalog,
                                                  const ValidatorOptions& options);

// Drives one plan request through generate -> parse -> schema -> constraints,
// re-prompting with the last diagnostic until a plan is accepted or the
// request's retry allowance is spent. Each run keeps its trace to itself, so
// one validator may serve concurrent requests.
class PlanValidator {
public:
  PlanValidator(std::shared_ptr<const FoodIndex> index, const PriceCatalog& catalog, PlanGenerationClient& client,
                ValidatorOptions options = ValidatorOptions());

  // Throws PlanRejected when every attempt is rejected,
  // GenerationTimeout when the overall deadline passes, and lets
  // GenerationUnavailable from the client through untouched.
  AcceptedPlan run(const PlanRequest& request);

private:
  std::shared_ptr<const FoodIndex> index_;
  const PriceCatalog& catalog_;
  PlanGenerationClient& client_;
  ValidatorOptions options_;
};
