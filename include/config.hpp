#pragma once

#include "food_index.hpp"
#include "generation_client.hpp"
#include "logging.hpp"
#include "nutrient_normalizer.hpp"
#include "plan_request.hpp"
#include "plan_validator.hpp"
#include "table_extractor.hpp"

#include <string>

struct DatasetConfig {
  std::string pdf = "data/KFCT_2018.pdf";
  std::string csv = "data/kfct_foods.csv";
  std::string prices = "data/prices_nairobi.json";
};

struct AppConfig {
  DatasetConfig dataset;
  ExtractionOptions extraction;  // page range comes from the dataset section
  TableSchema schema;
  NormalizerOptions normalizer;
  IndexOptions index;
  OllamaSettings service;
  GenerationOptions generation;
  ValidatorOptions validator;
  LoggingConfig logging;
};

// Column layout of the KFCT 2018 composition tables.
TableSchema defaultTableSchema();

AppConfig defaultConfig();

// Defaults overlaid with whatever the document sets. Throws ConfigError on
// malformed YAML or an out-of-range value.
AppConfig parseConfig(const std::string& yamlText, const std::string& origin = "<string>");

// A missing file yields defaults; an unreadable or malformed one throws ConfigError.
AppConfig loadConfig(const std::string& path);
