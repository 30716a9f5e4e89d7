#include "client_profile.hpp"
#include "config.hpp"
#include "cost_estimator.hpp"
#include "errors.hpp"
#include "extraction_pipeline.hpp"
#include "food_index.hpp"
#include "logging.hpp"
#include "nutrient_totals.hpp"
#include "plan_report.hpp"
#include "plan_request.hpp"
#include "plan_validator.hpp"
#include "price_catalog.hpp"
#include "table_extractor.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace {

const char* kDefaultConfig = "afyaplate.yaml";

void printUsage(const char* prog) {
  std::cerr << "Usage:\n"
            << "  " << prog << " extract [--config=file] [--tables-out=dir] [pdf_path]\n"
            << "  " << prog << " search [--config=file] [--lang=en|sw|any] [--group=label] [--limit=n] <query>\n"
            << "  " << prog << " plan [--config=file] [--out=file] <client.yaml>\n";
}

bool takeOption(const std::string& arg, const char* name, std::string& value) {
  std::string prefix = std::string("--") + name + "=";
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

void printRecord(const FoodRecord& r, const char* tag, double score) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", score);
  std::cout << tag << "\t" << buf << "\t" << r.id << "\t" << r.nameEn;
  if (!r.nameSw.empty()) std::cout << " (" << r.nameSw << ")";
  std::cout << "\t" << foodGroupKey(r.group) << "\n";
}

int runExtract(const AppConfig& config, const std::string& pdfArg, const std::string& tablesOutDir) {
  std::string pdfPath = pdfArg.empty() ? config.dataset.pdf : pdfArg;
  if (!std::filesystem::exists(pdfPath)) {
    std::cerr << "PDF not found: " << pdfPath << "\n";
    return 2;
  }

  auto pages = extractTablesFromPdf(pdfPath, config.extraction);
  if (!tablesOutDir.empty()) {
    writeTablesAsCsv(pages, tablesOutDir);
    std::cout << "Raw tables written to '" << tablesOutDir << "'\n";
  }

  FoodIndexStore store;
  ExtractionSummary summary =
    commitExtraction(std::move(pages), config.schema, config.normalizer, config.index, config.dataset.csv, store);

  std::cout << "Committed " << summary.recordCount << " food record(s) to '" << config.dataset.csv << "'\n"
            << "  rows read: " << summary.rowsRead << ", header rows skipped: " << summary.headerRowsSkipped << "\n"
            << "  duplicates dropped: " << summary.normalization.duplicatesDropped
            << ", rows excluded: " << summary.normalization.rowsExcluded
            << ", not-available cells: " << summary.normalization.notAvailableCells << "\n"
            << "  gap pages: " << summary.gaps.size() << ", schema mismatches: " << summary.schemaMismatches.size()
            << "\n";
  for (const RowDiagnostic& d : summary.normalization.diagnostics) {
    spdlog::debug("Extract: {} {} {}", d.origin, rowIssueName(d.issue), d.detail);
  }
  return 0;
}

int runSearch(const AppConfig& config, const std::string& query, const std::string& langArg,
              const std::string& groupArg, size_t limit) {
  std::optional<Language> lang = languageFromString(langArg);
  if (!lang) {
    std::cerr << "Unknown language: " << langArg << "\n";
    return 2;
  }
  FoodIndexStore store;
  auto index = loadFoodIndex(config.dataset.csv, config.index, store);

  std::optional<FoodGroup> group;
  if (!groupArg.empty()) {
    group = resolveFoodGroup(groupArg, config.normalizer.groupMatchThreshold);
    if (!group) {
      std::cerr << "Unknown food group: " << groupArg << "\n";
      return 2;
    }
  }
  auto inGroup = [&](const FoodRecord& r) { return !group || r.group == *group; };

  if (query.empty()) {
    size_t shown = 0;
    for (const auto& r : index->filterByGroup(*group)) {
      if (shown++ >= limit) break;
      printRecord(r, "group", 1.0);
    }
    return 0;
  }

  std::set<std::string> shown;
  std::optional<FoodRecord> exact = index->lookupExact(query, *lang);
  if (exact && inGroup(*exact)) {
    printRecord(*exact, "exact", 1.0);
    shown.insert(exact->id);
  }
  for (const auto& r : index->lookupPrefix(query, *lang, limit)) {
    if (shown.size() >= limit) break;
    if (!inGroup(r) || !shown.insert(r.id).second) continue;
    printRecord(r, "prefix", 1.0);
  }
  for (const auto& m : index->lookupFuzzy(query, *lang, limit)) {
    if (shown.size() >= limit) break;
    if (!inGroup(m.record) || !shown.insert(m.record.id).second) continue;
    printRecord(m.record, "fuzzy", m.score);
  }
  if (shown.empty()) std::cout << "No match for '" << query << "'\n";
  return 0;
}

int runPlan(const AppConfig& config, const std::string& clientPath, const std::string& outPath) {
  ClientProfile profile = loadClientProfile(clientPath);

  FoodIndexStore store;
  auto index = loadFoodIndex(config.dataset.csv, config.index, store);
  PriceCatalog catalog = loadPriceCatalog(config.dataset.prices);

  PlanRequest request = buildPlanRequest(profile, config.generation, *index);
  OllamaGenerationClient client(config.service);
  PlanValidator validator(index, catalog, client, config.validator);
  AcceptedPlan accepted = validator.run(request);

  CostedPlan costed = estimatePlanCost(accepted.plan, *index, catalog, profile.budget);
  auto nutrients = computeNutrientTotals(accepted.plan, *index);
  auto shopping = buildShoppingList(accepted.plan, *index, catalog);
  writePlanReport(buildPlanReport(profile, accepted, costed, nutrients, shopping), outPath);

  spdlog::info("Plan: total KSh {:.0f} against budget KSh {:.0f}: {}", costed.total, costed.budget,
               budgetVerdictName(costed.verdict));
  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    if (argc < 2) {
      printUsage(argv[0]);
      return 2;
    }
    std::string command = argv[1];
    std::string configPath = kDefaultConfig;
    std::string tablesOutDir;
    std::string outPath;
    std::string lang = "any";
    std::string group;
    std::string limitArg;
    std::string positional;

    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;
      if (takeOption(arg, "config", value)) {
        configPath = value;
      } else if (takeOption(arg, "tables-out", value)) {
        tablesOutDir = value;
      } else if (takeOption(arg, "out", value)) {
        outPath = value;
      } else if (takeOption(arg, "lang", value)) {
        lang = value;
      } else if (takeOption(arg, "group", value)) {
        group = value;
      } else if (takeOption(arg, "limit", value)) {
        limitArg = value;
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (positional.empty()) {
        positional = arg;
      } else {
        positional += " " + arg;
      }
    }

    size_t limit = 10;
    if (!limitArg.empty()) {
      try {
        limit = std::stoul(limitArg);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid --limit: " << limitArg << "\n";
        return 2;
      }
    }

    // stderr logging until the configured level and file are known
    initLogging(LoggingConfig());
    AppConfig config = loadConfig(configPath);
    initLogging(config.logging);

    if (command == "extract") return runExtract(config, positional, tablesOutDir);
    if (command == "search") {
      if (positional.empty() && group.empty()) {
        printUsage(argv[0]);
        return 2;
      }
      return runSearch(config, positional, lang, group, limit);
    }
    if (command == "plan") {
      if (positional.empty()) {
        printUsage(argv[0]);
        return 2;
      }
      return runPlan(config, positional, outPath);
    }
    printUsage(argv[0]);
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
