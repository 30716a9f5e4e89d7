#pragma once

#include "food_record.hpp"

#include <optional>
#include <string>
#include <unordered_map>

enum class PriceUnit { Kilogram, Gram, Per100Gram, Litre, Millilitre };

std::optional<PriceUnit> priceUnitFromString(const std::string& s);
const char* priceUnitName(PriceUnit unit);

// KSh per unit. Liquids are costed at 1 ml = 1 g.
struct UnitPrice {
  double amount;
  PriceUnit unit;

  double perGram() const;
};

// Read-only once loaded; shared by concurrent plan requests.
class PriceCatalog {
public:
  // key is a food id or a food name; names are matched after normalization.
  void set(const std::string& key, UnitPrice price);

  // By id first, then by English and Swahili name.
  std::optional<UnitPrice> priceFor(const FoodRecord& record) const;

  // Empty when the food has no price entry.
  std::optional<double> costFor(const FoodRecord& record, double grams) const;

  size_t size() const { return byKey_.size(); }

private:
  std::unordered_map<std::string, UnitPrice> byKey_;
  std::unordered_map<std::string, UnitPrice> byName_;
};

// {"<id or name>": {"price": 120, "unit": "kg"}} or {"<id or name>": 120} (per kg).
// Throws DatasetError on malformed JSON; unusable entries are skipped with a warning.
PriceCatalog parsePriceCatalog(const std::string& jsonText);

// A missing file yields an empty catalog, so every item is costed as unknown.
PriceCatalog loadPriceCatalog(const std::string& path);
