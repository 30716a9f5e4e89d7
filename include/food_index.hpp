#pragma once

#include "food_record.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class Language { English, Swahili, Any };

std::optional<Language> languageFromString(const std::string& s);

struct IndexOptions {
  double fuzzyThreshold = 0.75;
};

struct FuzzyMatch {
  FoodRecord record;
  double score;
};

// Immutable snapshot of the food-composition dataset. Every query is const and
// the object never changes after construction, so one instance can serve any
// number of concurrent readers.
class FoodIndex {
public:
  // Throws DatasetError on an empty or duplicate id or a negative nutrient.
  explicit FoodIndex(std::vector<FoodRecord> records, IndexOptions options = IndexOptions());

  std::optional<FoodRecord> lookupExact(const std::string& name, Language language) const;

  // Records whose normalized name starts with prefix, ordered by id.
  std::vector<FoodRecord> lookupPrefix(const std::string& prefix, Language language, size_t maxCandidates) const;

  // Candidates scoring at least the fuzzy threshold, best first, ties by id.
  std::vector<FuzzyMatch> lookupFuzzy(const std::string& name, Language language, size_t maxCandidates) const;

  std::vector<FoodRecord> filterByGroup(FoodGroup group) const;

  std::optional<FoodRecord> findById(const std::string& id) const;

  // Ordered by id.
  const std::vector<FoodRecord>& records() const { return records_; }
  size_t size() const { return records_.size(); }
  double fuzzyThreshold() const { return options_.fuzzyThreshold; }

private:
  double scoreRecord(size_t idx, const std::string& normalizedQuery, Language language) const;

  std::vector<FoodRecord> records_;
  IndexOptions options_;
  std::vector<std::string> normEn_;
  std::vector<std::string> normSw_;
  std::unordered_map<std::string, size_t> byId_;
  std::unordered_map<std::string, std::vector<size_t>> byNameEn_;
  std::unordered_map<std::string, std::vector<size_t>> byNameSw_;
  std::map<FoodGroup, std::vector<size_t>> byGroup_;
  std::unordered_map<std::string, std::vector<size_t>> byToken_;
};

// Holds the active index version. Readers take a shared_ptr copy and keep
// using that snapshot; commit() publishes a fully built replacement in one step.
class FoodIndexStore {
public:
  // Null before the first commit.
  std::shared_ptr<const FoodIndex> current() const;

  void commit(std::shared_ptr<const FoodIndex> next);

  uint64_t version() const;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const FoodIndex> current_;
  uint64_t version_ = 0;
};
