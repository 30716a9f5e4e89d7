#include "config.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace {

void require(bool ok, const std::string& origin, const std::string& what) {
  if (!ok) throw ConfigError(origin + ": " + what);
}

std::vector<std::string> stringList(const YAML::Node& node) {
  std::vector<std::string> out;
  if (node.IsSequence()) {
    for (const auto& v : node) out.push_back(v.as<std::string>());
  } else {
    out.push_back(node.as<std::string>());
  }
  return out;
}

void validate(const AppConfig& c, const std::string& origin) {
  require(c.extraction.firstPage >= 1, origin, "dataset.first_page must be at least 1");
  require(c.extraction.lastPage == -1 || c.extraction.lastPage >= c.extraction.firstPage, origin,
          "dataset.last_page must be -1 or not before first_page");
  require(c.extraction.regionGapFactor > 0.0, origin, "extraction.region_gap_factor must be positive");
  require(!c.schema.columns.empty(), origin, "schema.columns must not be empty");
  require(c.schema.minHeaderHits >= 1, origin, "schema.min_header_hits must be at least 1");
  require(c.normalizer.groupMatchThreshold >= 0.0 && c.normalizer.groupMatchThreshold <= 1.0, origin,
          "normalizer.group_match_threshold must be within [0, 1]");
  require(c.index.fuzzyThreshold >= 0.0 && c.index.fuzzyThreshold <= 1.0, origin,
          "index.fuzzy_threshold must be within [0, 1]");
  require(!c.generation.model.empty(), origin, "generation.model must not be empty");
  require(c.generation.timeout.count() > 0, origin, "generation.timeout_ms must be positive");
  require(c.generation.maxRetries >= 0, origin, "validator.max_retries must not be negative");
  require(!c.generation.mealSlots.empty(), origin, "validator.meal_slots must not be empty");
  require(c.validator.unresolvedTolerance >= 0.0 && c.validator.unresolvedTolerance <= 1.0, origin,
          "validator.unresolved_tolerance must be within [0, 1]");
  require(c.validator.dayCostFactor > 0.0, origin, "validator.day_cost_factor must be positive");
  require(c.validator.minEnergyRatio >= 0.0 && c.validator.minEnergyRatio <= c.validator.maxEnergyRatio, origin,
          "validator energy ratios must satisfy 0 <= min_energy_ratio <= max_energy_ratio");
}

} // namespace

TableSchema defaultTableSchema() {
  TableSchema schema;
  schema.version = "kfct-2018";
  schema.columns = {
    "code", "name_en", "name_sw", "water_g", "energy_kcal", "protein_g", "fat_g", "carbohydrate_g", "fiber_g",
    "calcium_mg", "iron_mg", "zinc_mg", "vit_a_mcg", "thiamin_mg", "riboflavin_mg", "niacin_mg", "vit_c_mg",
  };
  schema.headerTokens = {
    "code", "food name", "english", "swahili", "kiswahili", "water", "energy", "protein", "fat",
    "carbohydrate", "fibre", "fiber", "calcium", "iron", "zinc", "vitamin", "thiamin", "riboflavin", "niacin",
  };
  schema.minHeaderHits = 3;
  return schema;
}

AppConfig defaultConfig() {
  AppConfig config;
  config.extraction.firstPage = 29;
  config.extraction.lastPage = 202;
  config.schema = defaultTableSchema();
  return config;
}

AppConfig parseConfig(const std::string& yamlText, const std::string& origin) {
  AppConfig config = defaultConfig();
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yamlText);
  } catch (const YAML::Exception& e) {
    throw ConfigError(origin + ": " + e.what());
  }
  if (yaml.IsNull()) return config;
  require(yaml.IsMap(), origin, "top level must be a mapping");

  try {
    if (yaml["dataset"]) {
      const auto& d = yaml["dataset"];
      if (d["pdf"]) config.dataset.pdf = d["pdf"].as<std::string>();
      if (d["first_page"]) config.extraction.firstPage = d["first_page"].as<int>();
      if (d["last_page"]) config.extraction.lastPage = d["last_page"].as<int>();
      if (d["csv"]) config.dataset.csv = d["csv"].as<std::string>();
      if (d["prices"]) config.dataset.prices = d["prices"].as<std::string>();
    }

    if (yaml["schema"]) {
      const auto& s = yaml["schema"];
      if (s["version"]) config.schema.version = s["version"].as<std::string>();
      if (s["columns"]) config.schema.columns = stringList(s["columns"]);
      if (s["header_tokens"]) config.schema.headerTokens = stringList(s["header_tokens"]);
      if (s["min_header_hits"]) config.schema.minHeaderHits = s["min_header_hits"].as<int>();
    }

    if (yaml["normalizer"]) {
      const auto& n = yaml["normalizer"];
      if (n["group_match_threshold"]) config.normalizer.groupMatchThreshold = n["group_match_threshold"].as<double>();
      if (n["merge_duplicates_across_groups"]) {
        config.normalizer.mergeDuplicatesAcrossGroups = n["merge_duplicates_across_groups"].as<bool>();
      }
    }

    if (yaml["index"]) {
      const auto& i = yaml["index"];
      if (i["fuzzy_threshold"]) config.index.fuzzyThreshold = i["fuzzy_threshold"].as<double>();
    }

    if (yaml["generation"]) {
      const auto& g = yaml["generation"];
      if (g["host"]) config.service.host = g["host"].as<std::string>();
      if (g["port"]) config.service.port = g["port"].as<uint16_t>();
      if (g["model"]) config.generation.model = g["model"].as<std::string>();
      if (g["timeout_ms"]) config.generation.timeout = std::chrono::milliseconds(g["timeout_ms"].as<long>());
      if (g["temperature"]) config.generation.temperature = g["temperature"].as<double>();
      if (g["cultural_framing"]) config.generation.culturalFraming = g["cultural_framing"].as<std::string>();
      if (g["max_food_list_chars"]) config.generation.maxFoodListChars = g["max_food_list_chars"].as<size_t>();
    }

    if (yaml["validator"]) {
      const auto& v = yaml["validator"];
      if (v["max_retries"]) config.generation.maxRetries = v["max_retries"].as<int>();
      if (v["meal_slots"]) {
        config.generation.mealSlots.clear();
        for (const auto& label : stringList(v["meal_slots"])) {
          std::optional<MealSlot> slot = mealSlotFromString(label);
          require(slot.has_value(), origin, "unknown meal slot '" + label + "'");
          config.generation.mealSlots.push_back(*slot);
        }
      }
      if (v["allow_empty_slots"]) config.generation.allowEmptySlots = v["allow_empty_slots"].as<bool>();
      if (v["unresolved_tolerance"]) config.validator.unresolvedTolerance = v["unresolved_tolerance"].as<double>();
      if (v["day_cost_factor"]) config.validator.dayCostFactor = v["day_cost_factor"].as<double>();
      if (v["min_energy_ratio"]) config.validator.minEnergyRatio = v["min_energy_ratio"].as<double>();
      if (v["max_energy_ratio"]) config.validator.maxEnergyRatio = v["max_energy_ratio"].as<double>();
    }

    if (yaml["logging"]) {
      const auto& l = yaml["logging"];
      if (l["level"]) config.logging.level = l["level"].as<std::string>();
      if (l["file"]) config.logging.file = l["file"].as<std::string>();
    }

    if (yaml["extraction"]) {
      const auto& e = yaml["extraction"];
      if (e["workers"]) config.extraction.workers = e["workers"].as<unsigned>();
      if (e["region_gap_factor"]) config.extraction.regionGapFactor = e["region_gap_factor"].as<double>();
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError(origin + ": " + e.what());
  }

  validate(config, origin);
  return config;
}

AppConfig loadConfig(const std::string& path) {
  if (path.empty() || !std::filesystem::exists(path)) {
    spdlog::info("Config: '{}' not found, using defaults", path);
    return defaultConfig();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ConfigError("cannot open config " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  AppConfig config = parseConfig(ss.str(), path);
  spdlog::info("Config: loaded '{}'", path);
  return config;
}
