#include "food_dataset.hpp"

#include "csv.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>

const char* const kNotAvailable = "NA";

namespace {

const std::vector<std::string>& leadingColumns() {
  static const std::vector<std::string> cols = {
    "id", "code", "name_en", "name_sw", "group",
    "energy_kcal", "protein_g", "fat_g", "carbohydrate_g", "fiber_g",
  };
  return cols;
}

std::string formatValue(const NutrientValue& v) {
  if (!v) return kNotAvailable;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.10g", *v);
  return buf;
}

NutrientValue parseValue(const std::string& cell, const std::string& path, size_t line, const std::string& column) {
  if (cell.empty() || cell == kNotAvailable) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(cell.c_str(), &end);
  if (end == cell.c_str() || *end != '\0') {
    throw DatasetError(path + ":" + std::to_string(line) + ": column " + column + " is not a number: '" + cell + "'");
  }
  return v;
}

} // namespace

std::vector<std::string> datasetColumns(const std::vector<FoodRecord>& records) {
  std::vector<std::string> cols = leadingColumns();
  std::set<std::string> micro;
  for (const auto& r : records) {
    for (const auto& kv : r.micronutrients) micro.insert(kv.first);
  }
  cols.insert(cols.end(), micro.begin(), micro.end());
  return cols;
}

void writeDatasetAtomically(const std::vector<FoodRecord>& records, const std::string& path) {
  std::filesystem::path target(path);
  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());
  std::string tmp = path + ".tmp";

  const std::vector<std::string> cols = datasetColumns(records);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw DatasetError("cannot write " + tmp);
    out << formatCsvRow(cols) << "\n";
    for (const auto& r : records) {
      std::vector<std::string> row = {r.id, r.code, r.nameEn, r.nameSw, foodGroupKey(r.group)};
      for (size_t c = 5; c < cols.size(); ++c) row.push_back(formatValue(r.nutrient(cols[c])));
      out << formatCsvRow(row) << "\n";
    }
    out.flush();
    if (!out) throw DatasetError("failed while writing " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp);
    throw DatasetError("cannot replace " + path + ": " + ec.message());
  }
  spdlog::info("Dataset: wrote {} record(s) to '{}'", records.size(), path);
}

std::vector<FoodRecord> readDataset(const std::string& path) {
  if (!std::filesystem::exists(path)) throw DatasetError("dataset not found: " + path);
  std::vector<std::vector<std::string>> rows;
  try {
    rows = readCsvFile(path);
  } catch (const std::runtime_error& ex) {
    throw DatasetError(ex.what());
  }
  if (rows.empty()) throw DatasetError("dataset is empty: " + path);

  const std::vector<std::string>& header = rows.front();
  std::map<std::string, size_t> col;
  for (size_t i = 0; i < header.size(); ++i) col[header[i]] = i;
  for (const char* required : {"id", "name_en", "group"}) {
    if (!col.count(required)) throw DatasetError(path + ": missing column '" + std::string(required) + "'");
  }

  auto cellAt = [](const std::vector<std::string>& row, size_t idx) -> std::string {
    return idx < row.size() ? row[idx] : std::string();
  };

  std::vector<FoodRecord> records;
  records.reserve(rows.size() - 1);
  for (size_t line = 1; line < rows.size(); ++line) {
    const auto& row = rows[line];
    FoodRecord r;
    r.id = cellAt(row, col["id"]);
    r.nameEn = cellAt(row, col["name_en"]);
    if (col.count("name_sw")) r.nameSw = cellAt(row, col["name_sw"]);
    if (col.count("code")) r.code = cellAt(row, col["code"]);
    std::string groupKey = cellAt(row, col["group"]);
    std::optional<FoodGroup> group = foodGroupFromKey(groupKey);
    if (!group) throw DatasetError(path + ":" + std::to_string(line + 1) + ": unknown food group '" + groupKey + "'");
    r.group = *group;
    for (size_t c = 0; c < header.size(); ++c) {
      const std::string& name = header[c];
      if (name == "id" || name == "code" || name == "name_en" || name == "name_sw" || name == "group") continue;
      r.setNutrient(name, parseValue(cellAt(row, c), path, line + 1, name));
    }
    records.push_back(std::move(r));
  }
  spdlog::info("Dataset: loaded {} record(s) from '{}'", records.size(), path);
  return records;
}
