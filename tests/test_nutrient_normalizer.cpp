#include <catch2/catch_all.hpp>

#include "food_index.hpp"
#include "generation_client.hpp"
#include "nutrient_normalizer.hpp"
#include "plan_request.hpp"

#include <string>
#include <vector>

namespace {

TableSchema scenarioSchema() {
  TableSchema schema;
  schema.version = "test-1";
  schema.columns = {"name_en", "name_sw", "group", "energy_kcal", "protein_g", "fat_g", "carbohydrate_g"};
  return schema;
}

RawRow raw(int rowIndex, std::vector<std::string> cells) {
  return RawRow{30, 0, rowIndex, std::move(cells)};
}

std::vector<RawRow> scenarioRows() {
  return {
    raw(1, {"Ugali", "Ugali", "Cereals", "150", "4", "1", "35"}),
    raw(2, {"Sukuma Wiki", "Sukuma wiki", "Vegetables", "35", "3", "0.5", "5"}),
  };
}

} // namespace

TEST_CASE("Ugali and Sukuma Wiki rows become typed records", "[normalize]") {
  NormalizationResult result = normalizeRows(scenarioRows(), scenarioSchema(), NormalizerOptions());

  REQUIRE(result.records.size() == 2);
  const FoodRecord& ugali = result.records[0];
  REQUIRE(ugali.id == "ugali");
  REQUIRE(ugali.nameEn == "Ugali");
  REQUIRE(ugali.nameSw == "Ugali");
  REQUIRE(ugali.group == FoodGroup::Cereals);
  REQUIRE(ugali.energy == 150.0);
  REQUIRE(ugali.protein == 4.0);
  REQUIRE(ugali.fat == 1.0);
  REQUIRE(ugali.carbohydrate == 35.0);
  REQUIRE_FALSE(ugali.fiber.has_value());

  const FoodRecord& sukuma = result.records[1];
  REQUIRE(sukuma.id == "sukuma-wiki");
  REQUIRE(sukuma.nameSw == "Sukuma wiki");
  REQUIRE(sukuma.group == FoodGroup::Vegetables);
  REQUIRE(sukuma.energy == 35.0);
  REQUIRE(sukuma.fat == 0.5);
  REQUIRE(result.report.rowsExcluded == 0);
}

TEST_CASE("normalizing the same rows twice gives identical records", "[normalize]") {
  NormalizationResult a = normalizeRows(scenarioRows(), scenarioSchema(), NormalizerOptions());
  NormalizationResult b = normalizeRows(scenarioRows(), scenarioSchema(), NormalizerOptions());
  REQUIRE(a.records == b.records);
}

TEST_CASE("nutrient cells: trace and sentinels are not available, never zero", "[normalize]") {
  REQUIRE_FALSE(parseNutrientCell("tr").value.has_value());
  REQUIRE_FALSE(parseNutrientCell("Tr").invalid);
  REQUIRE_FALSE(parseNutrientCell("nd").value.has_value());
  REQUIRE_FALSE(parseNutrientCell("-").value.has_value());
  REQUIRE_FALSE(parseNutrientCell("").value.has_value());
  REQUIRE_FALSE(parseNutrientCell("<0.1").value.has_value());

  REQUIRE(parseNutrientCell("12.5").value == 12.5);
  REQUIRE(parseNutrientCell("3,4*").value == 3.4);
  REQUIRE(parseNutrientCell("(7)").value == 7.0);
  REQUIRE(parseNutrientCell("0").value == 0.0);

  ParsedNutrient negative = parseNutrientCell("-3");
  REQUIRE(negative.invalid);
  REQUIRE_FALSE(negative.value.has_value());
  REQUIRE(parseNutrientCell("abc").invalid);
}

TEST_CASE("a trace cell in a row stays not available in the record", "[normalize]") {
  std::vector<RawRow> rows = {raw(1, {"Kale", "Sukuma", "Vegetables", "tr", "3", "0.5", "5"})};
  NormalizationResult result = normalizeRows(rows, scenarioSchema(), NormalizerOptions());
  REQUIRE(result.records.size() == 1);
  REQUIRE_FALSE(result.records[0].energy.has_value());
  REQUIRE(result.report.notAvailableCells == 1);
  REQUIRE(result.report.count(RowIssue::InvalidNutrientCell) == 0);
}

TEST_CASE("group labels resolve exactly, by alias or fuzzily, else the row is excluded", "[normalize]") {
  REQUIRE(resolveFoodGroup("Cereals and their products", 0.8) == FoodGroup::Cereals);
  REQUIRE(resolveFoodGroup("mboga", 0.8) == FoodGroup::Vegetables);
  REQUIRE(resolveFoodGroup("Vegetable", 0.8) == FoodGroup::Vegetables);
  REQUIRE_FALSE(resolveFoodGroup("Spaceship parts", 0.8).has_value());

  std::vector<RawRow> rows = {
    raw(1, {"Ugali", "Ugali", "Cereals", "150", "4", "1", "35"}),
    raw(2, {"Widget", "", "Spaceship parts", "1", "1", "1", "1"}),
  };
  NormalizationResult result = normalizeRows(rows, scenarioSchema(), NormalizerOptions());
  REQUIRE(result.records.size() == 1);
  REQUIRE(result.report.rowsExcluded == 1);
  REQUIRE(result.report.count(RowIssue::GroupResolutionFailure) == 1);
  REQUIRE(result.report.diagnostics[0].origin == "page 30, table 0, row 2");
}

TEST_CASE("an empty group cell falls back to the food code letter", "[normalize]") {
  TableSchema schema;
  schema.columns = {"code", "name_en", "group", "energy_kcal"};
  std::vector<RawRow> rows = {raw(1, {"b002", "Cassava, raw", "", "160"})};
  NormalizationResult result = normalizeRows(rows, schema, NormalizerOptions());
  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].id == "B002");
  REQUIRE(result.records[0].group == FoodGroup::StarchyRoots);
}

TEST_CASE("rows without an English name are excluded", "[normalize]") {
  std::vector<RawRow> rows = {raw(1, {"  ", "Ugali", "Cereals", "150", "4", "1", "35"})};
  NormalizationResult result = normalizeRows(rows, scenarioSchema(), NormalizerOptions());
  REQUIRE(result.records.empty());
  REQUIRE(result.report.count(RowIssue::MissingName) == 1);
}

TEST_CASE("duplicates across groups follow the merge flag", "[normalize]") {
  std::vector<RawRow> rows = {
    raw(1, {"Pumpkin", "Malenge", "Vegetables", "26", "1", "0.1", "6"}),
    raw(2, {"Pumpkin", "Malenge", "Fruits", "26", "1", "0.1", "6"}),
    raw(3, {"pumpkin", "malenge", "Vegetables", "27", "1", "0.1", "6"}),
  };

  NormalizerOptions merge;
  merge.mergeDuplicatesAcrossGroups = true;
  NormalizationResult merged = normalizeRows(rows, scenarioSchema(), merge);
  REQUIRE(merged.records.size() == 1);
  REQUIRE(merged.report.duplicatesDropped == 2);
  REQUIRE(merged.records[0].energy == 26.0);

  NormalizerOptions keep;
  keep.mergeDuplicatesAcrossGroups = false;
  NormalizationResult distinct = normalizeRows(rows, scenarioSchema(), keep);
  REQUIRE(distinct.records.size() == 2);
  REQUIRE(distinct.report.duplicatesDropped == 1);
  REQUIRE(distinct.records[0].id == "pumpkin");
  REQUIRE(distinct.records[1].id == "pumpkin-fruits");
}

TEST_CASE("rows with the wrong cell count are excluded", "[normalize]") {
  std::vector<RawRow> rows = {raw(1, {"Ugali", "Ugali", "Cereals"})};
  NormalizationResult result = normalizeRows(rows, scenarioSchema(), NormalizerOptions());
  REQUIRE(result.records.empty());
  REQUIRE(result.report.count(RowIssue::ColumnCountMismatch) == 1);
}

TEST_CASE("a stray Latin-1 byte in a cell still yields a usable food list", "[normalize]") {
  std::vector<RawRow> rows = {
    raw(1, {"Pur\xE9" "e of pumpkin", "Malenge", "Vegetables", "26", "1", "0.1", "6"}),
    raw(2, {"Ugali", "Ugali", "Cereals", "150", "4", "1", "35"}),
  };
  NormalizationResult result = normalizeRows(rows, scenarioSchema(), NormalizerOptions());
  REQUIRE(result.records.size() == 2);
  REQUIRE(result.records[0].nameEn == "Pur\xC3\xA9" "e of pumpkin");

  FoodIndex index(result.records);
  ClientProfile profile;
  profile.name = "Achieng";
  profile.age = 40;
  profile.sex = Sex::Female;
  profile.budget = 2000.0;
  profile.durationDays = 2;
  profile.kcalGoal = 2000.0;
  PlanRequest request = buildPlanRequest(profile, GenerationOptions(), index);
  std::string body;
  REQUIRE_NOTHROW(body = buildChatRequestBody(request).dump());
  REQUIRE(body.find("Malenge") != std::string::npos);
}
