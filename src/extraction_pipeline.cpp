#include "extraction_pipeline.hpp"

#include "errors.hpp"
#include "food_dataset.hpp"

#include <spdlog/spdlog.h>

ExtractionSummary commitExtraction(std::vector<PageTables> pages, const TableSchema& schema,
                                   const NormalizerOptions& normalizerOptions, const IndexOptions& indexOptions,
                                   const std::string& datasetPath, FoodIndexStore& store) {
  ExtractionSummary summary;

  RawRowReader reader(std::move(pages), schema);
  std::vector<RawRow> rows = readAllRows(reader);
  summary.rowsRead = rows.size();
  summary.headerRowsSkipped = reader.headerRowsSkipped();
  summary.gaps = reader.gaps();
  summary.schemaMismatches = reader.schemaMismatches();

  NormalizationResult normalized = normalizeRows(rows, schema, normalizerOptions);
  summary.normalization = normalized.report;
  if (normalized.records.empty()) {
    throw ExtractionFailure("no food record survived normalization (" + std::to_string(rows.size()) +
                            " row(s) read, " + std::to_string(normalized.report.rowsExcluded) + " excluded)");
  }

  // built before anything is written; a bad record leaves the old version in place
  auto index = std::make_shared<const FoodIndex>(normalized.records, indexOptions);
  writeDatasetAtomically(index->records(), datasetPath);
  store.commit(index);

  summary.recordCount = index->size();
  summary.datasetVersion = store.version();
  spdlog::info("Pipeline: committed dataset version {} with {} record(s), {} gap page(s), {} schema mismatch(es)",
               summary.datasetVersion, summary.recordCount, summary.gaps.size(), summary.schemaMismatches.size());
  return summary;
}

std::shared_ptr<const FoodIndex> loadFoodIndex(const std::string& datasetPath, const IndexOptions& options,
                                               FoodIndexStore& store) {
  auto index = std::make_shared<const FoodIndex>(readDataset(datasetPath), options);
  store.commit(index);
  return index;
}
