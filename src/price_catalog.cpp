#include "price_catalog.hpp"

#include "errors.hpp"
#include "text_normalize.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

std::optional<PriceUnit> priceUnitFromString(const std::string& s) {
  std::string u = normalizeForMatch(s);
  if (u == "kg" || u == "kilogram" || u == "per kg") return PriceUnit::Kilogram;
  if (u == "g" || u == "gram" || u == "per g") return PriceUnit::Gram;
  if (u == "100g" || u == "100 g" || u == "per 100g" || u == "per 100 g") return PriceUnit::Per100Gram;
  if (u == "l" || u == "litre" || u == "liter" || u == "per l") return PriceUnit::Litre;
  if (u == "ml" || u == "millilitre" || u == "milliliter") return PriceUnit::Millilitre;
  return std::nullopt;
}

const char* priceUnitName(PriceUnit unit) {
  switch (unit) {
    case PriceUnit::Kilogram: return "kg";
    case PriceUnit::Gram: return "g";
    case PriceUnit::Per100Gram: return "100g";
    case PriceUnit::Litre: return "l";
    case PriceUnit::Millilitre: return "ml";
  }
  return "kg";
}

double UnitPrice::perGram() const {
  switch (unit) {
    case PriceUnit::Kilogram:
    case PriceUnit::Litre:
      return amount / 1000.0;
    case PriceUnit::Per100Gram:
      return amount / 100.0;
    case PriceUnit::Gram:
    case PriceUnit::Millilitre:
      return amount;
  }
  return amount / 1000.0;
}

void PriceCatalog::set(const std::string& key, UnitPrice price) {
  byKey_[key] = price;
  std::string norm = normalizeForMatch(key);
  if (!norm.empty()) byName_[norm] = price;
}

std::optional<UnitPrice> PriceCatalog::priceFor(const FoodRecord& record) const {
  auto it = byKey_.find(record.id);
  if (it != byKey_.end()) return it->second;
  for (const std::string* name : {&record.nameEn, &record.nameSw}) {
    std::string norm = normalizeForMatch(*name);
    if (norm.empty()) continue;
    auto n = byName_.find(norm);
    if (n != byName_.end()) return n->second;
  }
  return std::nullopt;
}

std::optional<double> PriceCatalog::costFor(const FoodRecord& record, double grams) const {
  std::optional<UnitPrice> price = priceFor(record);
  if (!price) return std::nullopt;
  return price->perGram() * grams;
}

PriceCatalog parsePriceCatalog(const std::string& jsonText) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::parse_error& ex) {
    throw DatasetError(std::string("price catalog is not valid JSON: ") + ex.what());
  }
  if (!doc.is_object()) throw DatasetError("price catalog must be a JSON object");

  PriceCatalog catalog;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const nlohmann::json& v = it.value();
    UnitPrice price{0.0, PriceUnit::Kilogram};
    if (v.is_number()) {
      price.amount = v.get<double>();
    } else if (v.is_object() && v.contains("price") && v["price"].is_number()) {
      price.amount = v["price"].get<double>();
      if (v.contains("unit")) {
        std::optional<PriceUnit> unit = v["unit"].is_string() ? priceUnitFromString(v["unit"].get<std::string>()) : std::nullopt;
        if (!unit) {
          spdlog::warn("PriceCatalog: '{}' has an unknown unit {}, skipped", it.key(), v["unit"].dump());
          continue;
        }
        price.unit = *unit;
      }
    } else {
      spdlog::warn("PriceCatalog: '{}' has no numeric price, skipped", it.key());
      continue;
    }
    if (price.amount < 0.0) {
      spdlog::warn("PriceCatalog: '{}' has a negative price, skipped", it.key());
      continue;
    }
    catalog.set(it.key(), price);
  }
  return catalog;
}

PriceCatalog loadPriceCatalog(const std::string& path) {
  if (path.empty() || !std::filesystem::exists(path)) {
    spdlog::warn("PriceCatalog: '{}' not found, costs will be reported as unknown", path);
    return PriceCatalog();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) throw DatasetError("cannot open price catalog " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  PriceCatalog catalog = parsePriceCatalog(ss.str());
  spdlog::info("PriceCatalog: loaded {} price(s) from '{}'", catalog.size(), path);
  return catalog;
}
