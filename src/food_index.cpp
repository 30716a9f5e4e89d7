#include "food_index.hpp"

#include "errors.hpp"
#include "text_normalize.hpp"

#include <algorithm>
#include <set>

namespace {

void checkNonNegative(const FoodRecord& r, const std::string& key, const NutrientValue& v) {
  if (v && *v < 0.0) throw DatasetError("record '" + r.id + "' has negative " + key);
}

} // namespace

std::optional<Language> languageFromString(const std::string& s) {
  std::string norm = normalizeForMatch(s);
  if (norm == "en" || norm == "english") return Language::English;
  if (norm == "sw" || norm == "swahili" || norm == "kiswahili") return Language::Swahili;
  if (norm == "any" || norm == "all") return Language::Any;
  return std::nullopt;
}

FoodIndex::FoodIndex(std::vector<FoodRecord> records, IndexOptions options)
  : records_(std::move(records)), options_(options) {
  std::sort(records_.begin(), records_.end(), [](const FoodRecord& a, const FoodRecord& b) { return a.id < b.id; });

  normEn_.reserve(records_.size());
  normSw_.reserve(records_.size());
  for (size_t i = 0; i < records_.size(); ++i) {
    const FoodRecord& r = records_[i];
    if (r.id.empty()) throw DatasetError("record '" + r.nameEn + "' has an empty id");
    if (!byId_.emplace(r.id, i).second) throw DatasetError("duplicate record id '" + r.id + "'");
    checkNonNegative(r, "energy_kcal", r.energy);
    checkNonNegative(r, "protein_g", r.protein);
    checkNonNegative(r, "fat_g", r.fat);
    checkNonNegative(r, "carbohydrate_g", r.carbohydrate);
    checkNonNegative(r, "fiber_g", r.fiber);
    for (const auto& kv : r.micronutrients) checkNonNegative(r, kv.first, kv.second);

    normEn_.push_back(normalizeForMatch(r.nameEn));
    normSw_.push_back(normalizeForMatch(r.nameSw));
    if (!normEn_.back().empty()) byNameEn_[normEn_.back()].push_back(i);
    if (!normSw_.back().empty()) byNameSw_[normSw_.back()].push_back(i);
    byGroup_[r.group].push_back(i);

    std::set<std::string> tokens;
    for (const auto& t : tokenize(normEn_.back())) tokens.insert(t);
    for (const auto& t : tokenize(normSw_.back())) tokens.insert(t);
    for (const auto& t : tokens) byToken_[t].push_back(i);
  }
}

std::optional<FoodRecord> FoodIndex::lookupExact(const std::string& name, Language language) const {
  std::string norm = normalizeForMatch(name);
  if (norm.empty()) return std::nullopt;

  // indices are ascending, so the first hit has the smallest id
  std::optional<size_t> hit;
  auto consider = [&](const std::unordered_map<std::string, std::vector<size_t>>& map) {
    auto it = map.find(norm);
    if (it == map.end()) return;
    size_t idx = it->second.front();
    if (!hit || idx < *hit) hit = idx;
  };
  if (language != Language::Swahili) consider(byNameEn_);
  if (language != Language::English) consider(byNameSw_);
  if (!hit) return std::nullopt;
  return records_[*hit];
}

std::vector<FoodRecord> FoodIndex::lookupPrefix(const std::string& prefix, Language language, size_t maxCandidates) const {
  std::vector<FoodRecord> out;
  std::string norm = normalizeForMatch(prefix);
  if (norm.empty()) return out;
  for (size_t i = 0; i < records_.size() && out.size() < maxCandidates; ++i) {
    bool en = language != Language::Swahili && normEn_[i].compare(0, norm.size(), norm) == 0;
    bool sw = language != Language::English && normSw_[i].compare(0, norm.size(), norm) == 0;
    if (en || sw) out.push_back(records_[i]);
  }
  return out;
}

double FoodIndex::scoreRecord(size_t idx, const std::string& normalizedQuery, Language language) const {
  double score = 0.0;
  if (language != Language::Swahili) score = similarityNormalized(normalizedQuery, normEn_[idx]);
  if (language != Language::English) score = std::max(score, similarityNormalized(normalizedQuery, normSw_[idx]));
  return score;
}

std::vector<FuzzyMatch> FoodIndex::lookupFuzzy(const std::string& name, Language language, size_t maxCandidates) const {
  std::vector<FuzzyMatch> out;
  std::string norm = normalizeForMatch(name);
  if (norm.empty() || maxCandidates == 0) return out;

  std::set<size_t> candidates;
  for (const auto& tok : tokenize(norm)) {
    auto it = byToken_.find(tok);
    if (it != byToken_.end()) candidates.insert(it->second.begin(), it->second.end());
  }

  std::vector<std::pair<size_t, double>> scored;
  for (size_t idx : candidates) {
    double s = scoreRecord(idx, norm, language);
    if (s >= options_.fuzzyThreshold) scored.emplace_back(idx, s);
  }
  // misspelt names share no token with the record: fall back to a full scan
  if (scored.empty()) {
    for (size_t idx = 0; idx < records_.size(); ++idx) {
      if (candidates.count(idx)) continue;
      double s = scoreRecord(idx, norm, language);
      if (s >= options_.fuzzyThreshold) scored.emplace_back(idx, s);
    }
  }

  std::sort(scored.begin(), scored.end(), [](const std::pair<size_t, double>& a, const std::pair<size_t, double>& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
  });
  if (scored.size() > maxCandidates) scored.resize(maxCandidates);
  out.reserve(scored.size());
  for (const auto& s : scored) out.push_back(FuzzyMatch{records_[s.first], s.second});
  return out;
}

std::vector<FoodRecord> FoodIndex::filterByGroup(FoodGroup group) const {
  std::vector<FoodRecord> out;
  auto it = byGroup_.find(group);
  if (it == byGroup_.end()) return out;
  out.reserve(it->second.size());
  for (size_t idx : it->second) out.push_back(records_[idx]);
  return out;
}

std::optional<FoodRecord> FoodIndex::findById(const std::string& id) const {
  auto it = byId_.find(id);
  if (it == byId_.end()) return std::nullopt;
  return records_[it->second];
}

std::shared_ptr<const FoodIndex> FoodIndexStore::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void FoodIndexStore::commit(std::shared_ptr<const FoodIndex> next) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(next);
  version_++;
}

uint64_t FoodIndexStore::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}
