#pragma once

#include "food_index.hpp"
#include "nutrient_normalizer.hpp"
#include "table_extractor.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct ExtractionSummary {
  size_t rowsRead = 0;
  size_t headerRowsSkipped = 0;
  std::vector<ExtractionGap> gaps;
  std::vector<std::string> schemaMismatches;
  NormalizationReport normalization;
  size_t recordCount = 0;
  uint64_t datasetVersion = 0;
};

// Reads rows, normalizes them, builds the index, writes the dataset and only
// then publishes the index in store. Throws ExtractionFailure when no row or
// no record survives, leaving both the file and the store untouched.
ExtractionSummary commitExtraction(std::vector<PageTables> pages, const TableSchema& schema,
                                   const NormalizerOptions& normalizerOptions, const IndexOptions& indexOptions,
                                   const std::string& datasetPath, FoodIndexStore& store);

// Startup path: read the canonical dataset and publish it.
std::shared_ptr<const FoodIndex> loadFoodIndex(const std::string& datasetPath, const IndexOptions& options,
                                               FoodIndexStore& store);
