#include "nutrient_normalizer.hpp"

#include "text_normalize.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <set>
#include <unordered_map>
#include <unordered_set>

const char* const kColumnNameEn = "name_en";
const char* const kColumnNameSw = "name_sw";
const char* const kColumnGroup = "group";
const char* const kColumnCode = "code";
const char* const kColumnIgnore = "ignore";

namespace {

const std::unordered_set<std::string>& notAvailableTokens() {
  static const std::unordered_set<std::string> tokens = {
    "tr", "trace", "traces", "nd", "n.d", "n.d.", "na", "n/a", "n.a", "n.a.",
    "-", "--", "---", "\xE2\x80\x93", "\xE2\x80\x94", "\xE2\x80\xA6", "...", "?",
  };
  return tokens;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string stripFootnoteMarks(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    if (ch == '*' || ch == '(' || ch == ')' || ch == '[' || ch == ']' || ch == ' ') continue;
    out.push_back(ch);
  }
  return out;
}

std::string makeUniqueId(const std::string& base, std::unordered_set<std::string>& used) {
  if (used.insert(base).second) return base;
  for (int n = 2;; ++n) {
    std::string candidate = base + "-" + std::to_string(n);
    if (used.insert(candidate).second) return candidate;
  }
}

} // namespace

const char* rowIssueName(RowIssue issue) {
  switch (issue) {
    case RowIssue::ColumnCountMismatch: return "column-count-mismatch";
    case RowIssue::MissingName: return "missing-name";
    case RowIssue::GroupResolutionFailure: return "group-resolution-failure";
    case RowIssue::InvalidNutrientCell: return "invalid-nutrient-cell";
    case RowIssue::DuplicateDropped: return "duplicate-dropped";
  }
  return "unknown";
}

size_t NormalizationReport::count(RowIssue issue) const {
  return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                           [issue](const RowDiagnostic& d) { return d.issue == issue; }));
}

ParsedNutrient parseNutrientCell(const std::string& cell) {
  ParsedNutrient parsed;
  std::string text = lower(cleanCellText(cell));
  if (text.empty() || notAvailableTokens().count(text)) return parsed;

  std::string compact = stripFootnoteMarks(text);
  if (compact.empty() || notAvailableTokens().count(compact)) return parsed;
  // "<0.1" is below the detection limit: a trace
  if (compact[0] == '<') return parsed;

  // digits with optional decimal part, then at most two footnote letters
  static const std::regex numberRe("^(-?[0-9]+(?:[.,][0-9]+)?)[a-z]{0,2}$");
  std::smatch m;
  if (!std::regex_match(compact, m, numberRe)) {
    parsed.invalid = true;
    return parsed;
  }
  std::string digits = m[1].str();
  std::replace(digits.begin(), digits.end(), ',', '.');
  double value = std::strtod(digits.c_str(), nullptr);
  if (value < 0.0) {
    parsed.invalid = true;
    return parsed;
  }
  parsed.value = value;
  return parsed;
}

std::optional<FoodGroup> resolveFoodGroup(const std::string& label, double threshold) {
  std::string norm = normalizeForMatch(label);
  if (norm.empty()) return std::nullopt;

  for (FoodGroup g : allFoodGroups()) {
    if (normalizeForMatch(foodGroupName(g)) == norm || normalizeForMatch(foodGroupKey(g)) == norm) return g;
    for (const auto& alias : foodGroupAliases(g)) {
      if (normalizeForMatch(alias) == norm) return g;
    }
  }

  std::optional<FoodGroup> best;
  double bestScore = 0.0;
  for (FoodGroup g : allFoodGroups()) {
    double score = similarityNormalized(norm, normalizeForMatch(foodGroupName(g)));
    for (const auto& alias : foodGroupAliases(g)) {
      score = std::max(score, similarityNormalized(norm, normalizeForMatch(alias)));
    }
    if (score > bestScore) {
      bestScore = score;
      best = g;
    }
  }
  if (best && bestScore >= threshold) return best;
  return std::nullopt;
}

NormalizationResult normalizeRows(const std::vector<RawRow>& rows, const TableSchema& schema,
                                  const NormalizerOptions& options) {
  NormalizationResult result;
  NormalizationReport& report = result.report;
  report.rowsIn = rows.size();

  std::unordered_map<std::string, std::string> seenKeys;  // dedup key -> origin of the kept row
  std::unordered_set<std::string> usedIds;

  auto exclude = [&](const RawRow& row, RowIssue issue, const std::string& detail) {
    report.diagnostics.push_back(RowDiagnostic{row.origin(), issue, detail});
    report.rowsExcluded++;
  };

  for (const RawRow& row : rows) {
    if (row.cells.size() != schema.columns.size()) {
      exclude(row, RowIssue::ColumnCountMismatch,
              std::to_string(row.cells.size()) + " cell(s), expected " + std::to_string(schema.columns.size()));
      continue;
    }

    FoodRecord record;
    std::string groupLabel;
    std::vector<RowDiagnostic> cellIssues;
    size_t notAvailable = 0;

    for (size_t c = 0; c < schema.columns.size(); ++c) {
      const std::string& role = schema.columns[c];
      const std::string& cell = row.cells[c];
      if (role == kColumnNameEn) {
        record.nameEn = cleanCellText(cell);
      } else if (role == kColumnNameSw) {
        record.nameSw = cleanCellText(cell);
      } else if (role == kColumnGroup) {
        groupLabel = cleanCellText(cell);
      } else if (role == kColumnCode) {
        record.code = cleanCellText(cell);
        std::transform(record.code.begin(), record.code.end(), record.code.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
      } else if (role == kColumnIgnore) {
        continue;
      } else {
        ParsedNutrient parsed = parseNutrientCell(cell);
        if (parsed.invalid) {
          cellIssues.push_back(RowDiagnostic{row.origin(), RowIssue::InvalidNutrientCell,
                                             role + " = '" + cleanCellText(cell) + "'"});
        }
        if (!parsed.value) notAvailable++;
        record.setNutrient(role, parsed.value);
      }
    }

    if (normalizeForMatch(record.nameEn).empty()) {
      exclude(row, RowIssue::MissingName, "empty English name");
      continue;
    }

    std::optional<FoodGroup> group;
    if (!groupLabel.empty()) group = resolveFoodGroup(groupLabel, options.groupMatchThreshold);
    else group = foodGroupFromCode(record.code);
    if (!group) {
      std::string label = groupLabel.empty() ? "code '" + record.code + "'" : "'" + groupLabel + "'";
      spdlog::warn("Normalizer: {} excluded, food group {} not recognised", row.origin(), label);
      exclude(row, RowIssue::GroupResolutionFailure, label);
      continue;
    }
    record.group = *group;

    std::string key = normalizeForMatch(record.nameEn) + "|" + normalizeForMatch(record.nameSw);
    if (!options.mergeDuplicatesAcrossGroups) key += "|" + foodGroupKey(record.group);
    auto seen = seenKeys.find(key);
    if (seen != seenKeys.end()) {
      report.diagnostics.push_back(RowDiagnostic{row.origin(), RowIssue::DuplicateDropped,
                                                 "'" + record.nameEn + "' first seen at " + seen->second});
      report.duplicatesDropped++;
      continue;
    }
    seenKeys.emplace(key, row.origin());

    std::string base = record.code.empty() ? slugify(record.nameEn) : record.code;
    if (!record.code.empty() || usedIds.count(base) == 0 || options.mergeDuplicatesAcrossGroups) {
      record.id = makeUniqueId(base, usedIds);
    } else {
      record.id = makeUniqueId(base + "-" + foodGroupKey(record.group), usedIds);
    }

    for (auto& issue : cellIssues) report.diagnostics.push_back(std::move(issue));
    report.notAvailableCells += notAvailable;
    result.records.push_back(std::move(record));
  }

  report.recordsOut = result.records.size();
  spdlog::info("Normalizer: {} row(s) in, {} record(s) out, {} duplicate(s) dropped, {} row(s) excluded",
               report.rowsIn, report.recordsOut, report.duplicatesDropped, report.rowsExcluded);
  return result;
}
