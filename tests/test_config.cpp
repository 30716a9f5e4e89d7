#include <catch2/catch_all.hpp>

#include "client_profile.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

fs::path writeTemp(const std::string& name, const std::string& text) {
  fs::path p = fs::temp_directory_path() / ("afyaplate_" + name);
  std::ofstream(p) << text;
  return p;
}

} // namespace

TEST_CASE("defaults describe the KFCT 2018 tables and a local service", "[config]") {
  AppConfig c = defaultConfig();
  REQUIRE(c.extraction.firstPage == 29);
  REQUIRE(c.extraction.lastPage == 202);
  REQUIRE(c.schema.version == "kfct-2018");
  REQUIRE(c.schema.columns.size() == 17);
  REQUIRE(c.schema.columns[1] == "name_en");
  REQUIRE(c.index.fuzzyThreshold == Catch::Approx(0.75));
  REQUIRE(c.normalizer.mergeDuplicatesAcrossGroups);
  REQUIRE(c.service.port == 11434);
  REQUIRE(c.generation.model == "llama3");
  REQUIRE(c.generation.maxRetries == 2);
  REQUIRE(c.generation.mealSlots.size() == 3);
  REQUIRE(c.validator.unresolvedTolerance == Catch::Approx(0.10));
  REQUIRE(c.logging.level == "info");
}

TEST_CASE("a config document overrides only what it sets", "[config]") {
  AppConfig c = parseConfig(R"(
dataset:
  csv: out/foods.csv
  first_page: 30
generation:
  model: mistral
  port: 8080
  timeout_ms: 5000
validator:
  max_retries: 0
  meal_slots: [breakfast, lunch, dinner, snacks]
  allow_empty_slots: true
logging:
  level: debug
)");
  REQUIRE(c.dataset.csv == "out/foods.csv");
  REQUIRE(c.dataset.pdf == "data/KFCT_2018.pdf");
  REQUIRE(c.extraction.firstPage == 30);
  REQUIRE(c.extraction.lastPage == 202);
  REQUIRE(c.generation.model == "mistral");
  REQUIRE(c.service.port == 8080);
  REQUIRE(c.service.host == "127.0.0.1");
  REQUIRE(c.generation.timeout == std::chrono::milliseconds(5000));
  REQUIRE(c.generation.maxRetries == 0);
  REQUIRE(c.generation.mealSlots.back() == MealSlot::Snack);
  REQUIRE(c.generation.allowEmptySlots);
  REQUIRE(c.logging.level == "debug");
}

TEST_CASE("bad config values are rejected", "[config]") {
  REQUIRE_THROWS_AS(parseConfig("generation: [unclosed"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("- just\n- a list\n"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("validator:\n  max_retries: lots\n"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("validator:\n  max_retries: -1\n"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("validator:\n  meal_slots: [elevenses]\n"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("index:\n  fuzzy_threshold: 1.5\n"), ConfigError);
  REQUIRE_THROWS_AS(parseConfig("dataset:\n  first_page: 50\n  last_page: 40\n"), ConfigError);
  REQUIRE_THROWS_WITH(parseConfig("generation:\n  model: ''\n", "afyaplate.yaml"),
                      "afyaplate.yaml: generation.model must not be empty");
}

TEST_CASE("a missing config file means defaults", "[config]") {
  fs::path absent = fs::temp_directory_path() / "afyaplate_absent.yaml";
  fs::remove(absent);
  REQUIRE(loadConfig(absent.string()).generation.model == "llama3");

  fs::path present = writeTemp("present.yaml", "generation:\n  model: phi3\n");
  REQUIRE(loadConfig(present.string()).generation.model == "phi3");
}

TEST_CASE("client profiles load from YAML", "[config][profile]") {
  fs::path p = writeTemp("client.yaml", R"(
name: Wanjiru
age: 52
sex: F
conditions: [Diabetes Type 2, hypertension]
budget: 3500
duration_days: 5
kcal_goal: 1800
preferences: likes githeri
exclusions: [pork, groundnuts]
)");
  ClientProfile c = loadClientProfile(p.string());
  REQUIRE(c.name == "Wanjiru");
  REQUIRE(c.age == 52);
  REQUIRE(c.sex == Sex::Female);
  REQUIRE((c.conditions == std::vector<HealthCondition>{HealthCondition::DiabetesType2, HealthCondition::Hypertension}));
  REQUIRE(c.budget == Catch::Approx(3500.0));
  REQUIRE(c.durationDays == 5);
  REQUIRE(c.kcalGoal == Catch::Approx(1800.0));
  REQUIRE(c.exclusions.size() == 2);

  fs::path minimal = writeTemp("minimal.yaml", "age: 30\nbudget: 1000\nduration_days: 1\n");
  ClientProfile m = loadClientProfile(minimal.string());
  REQUIRE(m.conditions == std::vector<HealthCondition>{HealthCondition::GeneralWellness});
  REQUIRE(m.sex == Sex::Unspecified);
}

TEST_CASE("bad client profiles are config errors", "[config][profile]") {
  REQUIRE_THROWS_AS(loadClientProfile((fs::temp_directory_path() / "afyaplate_nobody.yaml").string()), ConfigError);
  REQUIRE_THROWS_AS(loadClientProfile(writeTemp("bad_sex.yaml", "sex: sometimes\n").string()), ConfigError);
  REQUIRE_THROWS_AS(loadClientProfile(writeTemp("bad_cond.yaml", "conditions: [scurvy]\n").string()), ConfigError);
  REQUIRE_THROWS_AS(loadClientProfile(writeTemp("bad_age.yaml", "age: old\n").string()), ConfigError);
}

TEST_CASE("exclusions match whole words", "[profile]") {
  REQUIRE(matchesExclusion("Beef stew", {"beef"}));
  REQUIRE_FALSE(matchesExclusion("Beetroot", {"beef"}));
  REQUIRE(matchesExclusion("Groundnuts, roasted", {"groundnuts"}));
  REQUIRE(matchesExclusion("Cow milk, whole", {"whole milk"}));
  REQUIRE_FALSE(matchesExclusion("Cow milk, skimmed", {"whole milk"}));
}
