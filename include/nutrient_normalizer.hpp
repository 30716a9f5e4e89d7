#pragma once

#include "food_record.hpp"
#include "table_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

// Column roles understood besides nutrient keys.
extern const char* const kColumnNameEn;
extern const char* const kColumnNameSw;
extern const char* const kColumnGroup;
extern const char* const kColumnCode;
extern const char* const kColumnIgnore;

struct NormalizerOptions {
  double groupMatchThreshold = 0.8;
  // true: identical English+Swahili names collapse even across food groups.
  bool mergeDuplicatesAcrossGroups = true;
};

enum class RowIssue {
  ColumnCountMismatch,
  MissingName,
  GroupResolutionFailure,
  InvalidNutrientCell,
  DuplicateDropped,
};

const char* rowIssueName(RowIssue issue);

struct RowDiagnostic {
  std::string origin;
  RowIssue issue;
  std::string detail;
};

struct NormalizationReport {
  size_t rowsIn = 0;
  size_t recordsOut = 0;
  size_t duplicatesDropped = 0;
  size_t rowsExcluded = 0;
  size_t notAvailableCells = 0;
  std::vector<RowDiagnostic> diagnostics;

  size_t count(RowIssue issue) const;
};

struct NormalizationResult {
  std::vector<FoodRecord> records;
  NormalizationReport report;
};

struct ParsedNutrient {
  NutrientValue value;
  bool invalid = false;  // unparseable or negative, reported as a diagnostic
};

// "12.5" -> 12.5, "tr" / "nd" / "-" / "" -> not available, "3,4*" -> 3.4.
ParsedNutrient parseNutrientCell(const std::string& cell);

// Exact match on the group name, key or an alias, then the best fuzzy match
// at or above threshold.
std::optional<FoodGroup> resolveFoodGroup(const std::string& label, double threshold);

// Types and canonicalizes raw rows. Row-level problems never abort the batch:
// they are recorded in the report and the row is excluded. The output is a
// pure function of the input rows, schema and options.
NormalizationResult normalizeRows(const std::vector<RawRow>& rows, const TableSchema& schema,
                                  const NormalizerOptions& options);
