#include "table_extractor.hpp"

#include "csv.hpp"
#include "errors.hpp"
#include "text_normalize.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

void appendUtf8(std::string& out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code >= 0xD800 && code <= 0xDFFF) {
    // lone surrogate: not a character
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        bool numeric = false;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          char* end = nullptr;
          unsigned long code = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
          if (!digits.empty() && end != nullptr && *end == '\0' && code > 0) {
            appendUtf8(rep, code);
            numeric = true;
          }
        }
        if (!rep.empty() || numeric) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size()/2, v.end());
  return v[v.size()/2];
}

struct RowGroup { double yCenter; std::vector<const WordBox*> words; };

struct Phrase {
  double xMin;
  double xMax;
  std::string text;

  double center() const { return (xMin + xMax) * 0.5; }
};

struct PhraseRow { double yCenter; std::vector<Phrase> phrases; };

struct ColumnBand { double xMin; double xMax; double center; };

std::vector<RowGroup> clusterRows(const std::vector<WordBox>& wordsOnPage, double hMed) {
  std::vector<RowGroup> rows;
  if (wordsOnPage.empty()) return rows;

  double tol = hMed > 0 ? hMed * 0.8 : 6.0;

  std::vector<const WordBox*> sorted;
  sorted.reserve(wordsOnPage.size());
  for (const auto& w : wordsOnPage) sorted.push_back(&w);
  std::sort(sorted.begin(), sorted.end(), [](const WordBox* a, const WordBox* b) {
    double ya = (a->yMin + a->yMax) * 0.5;
    double yb = (b->yMin + b->yMax) * 0.5;
    if (ya == yb) return a->xMin < b->xMin;
    return ya < yb;
  });

  for (const auto* w : sorted) {
    double yc = (w->yMin + w->yMax) * 0.5;
    if (rows.empty() || std::abs(yc - rows.back().yCenter) > tol) {
      rows.push_back(RowGroup{yc, {}});
    }
    rows.back().words.push_back(w);
    // update running yCenter as average
    rows.back().yCenter = (rows.back().yCenter * (rows.back().words.size() - 1) + yc) / rows.back().words.size();
  }

  for (auto& r : rows) {
    std::sort(r.words.begin(), r.words.end(), [](const WordBox* a, const WordBox* b){ return a->xMin < b->xMin; });
  }
  return rows;
}

// Words closer than a normal space belong to the same cell.
PhraseRow buildPhrases(const RowGroup& row, double spaceTol) {
  PhraseRow out{row.yCenter, {}};
  for (const auto* w : row.words) {
    if (!out.phrases.empty() && w->xMin - out.phrases.back().xMax <= spaceTol) {
      Phrase& p = out.phrases.back();
      p.text += ' ';
      p.text += w->text;
      p.xMax = std::max(p.xMax, w->xMax);
    } else {
      out.phrases.push_back(Phrase{w->xMin, w->xMax, w->text});
    }
  }
  return out;
}

std::vector<std::vector<PhraseRow>> splitRegions(std::vector<PhraseRow> rows, double hMed, double gapFactor) {
  std::vector<std::vector<PhraseRow>> regions;
  if (rows.empty()) return regions;

  std::vector<double> gaps;
  for (size_t i = 1; i < rows.size(); ++i) gaps.push_back(rows[i].yCenter - rows[i-1].yCenter);
  double limit = gapFactor * std::max(median(gaps), hMed);

  regions.emplace_back();
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0 && rows[i].yCenter - rows[i-1].yCenter > limit) regions.emplace_back();
    regions.back().push_back(std::move(rows[i]));
  }
  return regions;
}

// Column bands come from the rows carrying the most common number of cells;
// rows with blank cells are then placed against those bands.
std::vector<ColumnBand> recoverColumns(const std::vector<PhraseRow>& region) {
  std::map<size_t, int> counts;
  for (const auto& r : region) {
    if (r.phrases.size() >= 2) counts[r.phrases.size()]++;
  }
  if (counts.empty()) return {};

  size_t modeSize = 0;
  int modeFreq = 0;
  for (const auto& kv : counts) {
    if (kv.second >= modeFreq) { modeFreq = kv.second; modeSize = kv.first; }
  }

  std::vector<ColumnBand> bands(modeSize, ColumnBand{0.0, 0.0, 0.0});
  std::vector<double> centerSums(modeSize, 0.0);
  int n = 0;
  for (const auto& r : region) {
    if (r.phrases.size() != modeSize) continue;
    for (size_t c = 0; c < modeSize; ++c) {
      const Phrase& p = r.phrases[c];
      if (n == 0) {
        bands[c].xMin = p.xMin;
        bands[c].xMax = p.xMax;
      } else {
        bands[c].xMin = std::min(bands[c].xMin, p.xMin);
        bands[c].xMax = std::max(bands[c].xMax, p.xMax);
      }
      centerSums[c] += p.center();
    }
    n++;
  }
  for (size_t c = 0; c < modeSize; ++c) bands[c].center = centerSums[c] / n;
  return bands;
}

std::vector<std::vector<std::string>> buildGrid(const std::vector<PhraseRow>& rows, const std::vector<ColumnBand>& bands) {
  const size_t numCols = bands.size();
  std::vector<std::vector<std::string>> grid;
  grid.reserve(rows.size());
  for (const auto& r : rows) {
    std::vector<std::string> row(numCols);
    for (const auto& p : r.phrases) {
      double xc = p.center();
      size_t bestIdx = numCols;
      for (size_t c = 0; c < numCols; ++c) {
        if (xc >= bands[c].xMin && xc <= bands[c].xMax) { bestIdx = c; break; }
      }
      if (bestIdx == numCols) {
        // assign to nearest column center
        bestIdx = 0;
        double bestDist = std::abs(xc - bands[0].center);
        for (size_t c = 1; c < numCols; ++c) {
          double d = std::abs(xc - bands[c].center);
          if (d < bestDist) { bestDist = d; bestIdx = c; }
        }
      }
      if (!row[bestIdx].empty()) row[bestIdx] += ' ';
      row[bestIdx] += p.text;
    }
    grid.push_back(std::move(row));
  }
  return grid;
}

bool containsPhrase(const std::string& normalizedCell, const std::string& normalizedToken) {
  if (normalizedToken.empty()) return false;
  std::string haystack = " " + normalizedCell + " ";
  return haystack.find(" " + normalizedToken + " ") != std::string::npos;
}

} // namespace

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw ExtractionFailure("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q \"" + pdfPath + "\" -";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw ExtractionFailure("failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw ExtractionFailure("pdftotext -bbox-layout returned error for " + pdfPath);
  return out;
}

BboxDocument parseBboxLayout(const std::string& xmlish, int firstPage) {
  BboxDocument doc;
  std::regex tagRe("<page\\b[^>]*>|<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>(.*?)</word>");
  std::regex pageNumberRe("number=\"([0-9]+)\"");

  int currentPage = firstPage - 1;
  std::set<int> seen;
  auto announce = [&](int page) {
    currentPage = page;
    if (seen.insert(page).second) doc.pages.push_back(page);
  };

  for (std::sregex_iterator it(xmlish.begin(), xmlish.end(), tagRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (!m[1].matched) {
      std::smatch num;
      std::string tag = m.str(0);
      if (std::regex_search(tag, num, pageNumberRe)) announce(std::stoi(num[1].str()));
      else announce(currentPage + 1);
      continue;
    }
    if (doc.pages.empty()) announce(firstPage);
    WordBox w;
    w.pageNumber = currentPage;
    w.xMin = std::stod(m[1].str());
    w.yMin = std::stod(m[2].str());
    w.xMax = std::stod(m[3].str());
    w.yMax = std::stod(m[4].str());
    w.text = decodeEntities(m[5].str());
    if (!trim(w.text).empty()) doc.words.push_back(std::move(w));
  }
  return doc;
}

std::vector<Table> extractPageTables(int pageNumber, std::vector<WordBox> words, const ExtractionOptions& options) {
  std::vector<Table> tables;
  if (words.empty()) return tables;

  std::vector<double> heights;
  heights.reserve(words.size());
  for (const auto& w : words) heights.push_back(w.yMax - w.yMin);
  double hMed = median(heights);
  double spaceTol = hMed > 0 ? hMed * 0.6 : 4.0;

  std::vector<RowGroup> rows = clusterRows(words, hMed);
  std::vector<PhraseRow> phraseRows;
  phraseRows.reserve(rows.size());
  for (const auto& r : rows) phraseRows.push_back(buildPhrases(r, spaceTol));

  int regionIndex = 0;
  for (auto& region : splitRegions(std::move(phraseRows), hMed, options.regionGapFactor)) {
    if (region.size() < 2) continue;
    std::vector<ColumnBand> bands = recoverColumns(region);
    if (bands.size() < 2) continue; // need at least 2 columns to be a table

    Table t;
    t.pageNumber = pageNumber;
    t.regionIndex = regionIndex++;
    t.rows = buildGrid(region, bands);
    tables.push_back(std::move(t));
  }
  return tables;
}

std::vector<PageTables> extractTablesFromDocument(const BboxDocument& doc, const ExtractionOptions& options) {
  std::map<int, std::vector<WordBox>> pageWords;
  for (const auto& w : doc.words) pageWords[w.pageNumber].push_back(w);

  std::vector<int> pageOrder = doc.pages;
  for (const auto& kv : pageWords) {
    if (std::find(pageOrder.begin(), pageOrder.end(), kv.first) == pageOrder.end()) pageOrder.push_back(kv.first);
  }

  unsigned workers = options.workers;
  if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());

  std::vector<PageTables> result;
  result.reserve(pageOrder.size());
  for (size_t start = 0; start < pageOrder.size(); start += workers) {
    size_t end = std::min(pageOrder.size(), start + workers);
    std::vector<std::future<std::vector<Table>>> batch;
    for (size_t i = start; i < end; ++i) {
      std::vector<WordBox> words;
      auto it = pageWords.find(pageOrder[i]);
      if (it != pageWords.end()) words = std::move(it->second);
      batch.push_back(std::async(std::launch::async, extractPageTables, pageOrder[i], std::move(words), std::cref(options)));
    }
    // futures are collected in page order so document order survives the merge
    for (size_t i = start; i < end; ++i) {
      result.push_back(PageTables{pageOrder[i], batch[i - start].get()});
    }
  }
  return result;
}

std::vector<PageTables> extractTablesFromPdf(const std::string& pdfPath, const ExtractionOptions& options) {
  std::string xmlish = runPdftotextBboxLayout(pdfPath, options.firstPage, options.lastPage);
  BboxDocument doc = parseBboxLayout(xmlish, options.firstPage > 0 ? options.firstPage : 1);
  spdlog::info("TableExtractor: '{}' yielded {} word(s) on {} page(s)", pdfPath, doc.words.size(), doc.pages.size());
  return extractTablesFromDocument(doc, options);
}

void writeTablesAsCsv(const std::vector<PageTables>& pages, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  for (const auto& page : pages) {
    int indexPerPage = 0;
    for (const auto& t : page.tables) {
      std::string filename = outDir + "/table_" + std::to_string(page.pageNumber) + "_" + std::to_string(indexPerPage++) + ".csv";
      std::ofstream ofs(filename);
      if (!ofs) throw std::runtime_error("cannot write " + filename);
      for (const auto& r : t.rows) ofs << formatCsvRow(r) << "\n";
    }
  }
}

std::string RawRow::origin() const {
  return "page " + std::to_string(pageNumber) + ", table " + std::to_string(tableIndex) +
         ", row " + std::to_string(rowIndex);
}

bool isHeaderRow(const std::vector<std::string>& cells, const TableSchema& schema) {
  if (cells.size() != schema.columns.size()) return false;
  std::vector<std::string> tokens;
  tokens.reserve(schema.headerTokens.size());
  for (const auto& t : schema.headerTokens) tokens.push_back(normalizeForMatch(t));

  int hits = 0;
  for (const auto& cell : cells) {
    std::string norm = normalizeForMatch(cell);
    if (norm.empty()) continue;
    for (const auto& tok : tokens) {
      if (containsPhrase(norm, tok)) { hits++; break; }
    }
  }
  return hits >= schema.minHeaderHits;
}

RawRowReader::RawRowReader(std::vector<PageTables> pages, TableSchema schema)
  : pages_(std::move(pages)), schema_(std::move(schema)) {}

bool RawRowReader::next(RawRow& row) {
  while (pageIdx_ < pages_.size()) {
    const PageTables& page = pages_[pageIdx_];
    while (tableIdx_ < page.tables.size()) {
      const Table& t = page.tables[tableIdx_];
      if (!tableChecked_) {
        tableChecked_ = true;
        if (t.columnCount() != schema_.columns.size()) {
          std::string msg = "page " + std::to_string(page.pageNumber) + ", table " + std::to_string(tableIdx_) +
                            ": " + std::to_string(t.columnCount()) + " column(s), schema " + schema_.version +
                            " expects " + std::to_string(schema_.columns.size());
          spdlog::warn("TableExtractor: schema mismatch at {}", msg);
          mismatches_.push_back(msg);
          mismatchesOnPage_++;
          tableIdx_++;
          rowIdx_ = 0;
          tableChecked_ = false;
          continue;
        }
      }
      while (rowIdx_ < t.rows.size()) {
        size_t index = rowIdx_++;
        const auto& cells = t.rows[index];
        if (isHeaderRow(cells, schema_)) {
          headerRows_++;
          headersOnPage_++;
          continue;
        }
        bool blank = std::all_of(cells.begin(), cells.end(), [](const std::string& c) { return trim(c).empty(); });
        if (blank) continue;
        row = RawRow{page.pageNumber, static_cast<int>(tableIdx_), static_cast<int>(index), cells};
        rowsOnPage_++;
        rowsRead_++;
        return true;
      }
      tableIdx_++;
      rowIdx_ = 0;
      tableChecked_ = false;
    }
    finishPage();
    pageIdx_++;
    tableIdx_ = 0;
    rowIdx_ = 0;
    tableChecked_ = false;
  }
  return false;
}

void RawRowReader::finishPage() {
  const PageTables& page = pages_[pageIdx_];
  if (rowsOnPage_ == 0) {
    std::string reason;
    if (page.tables.empty()) reason = "no table region";
    else if (mismatchesOnPage_ == page.tables.size()) reason = "no table matching the column schema";
    else if (headersOnPage_ > 0) reason = "header rows only";
    else reason = "no data rows";
    spdlog::warn("TableExtractor: page {} skipped ({})", page.pageNumber, reason);
    gaps_.push_back(ExtractionGap{page.pageNumber, reason});
  }
  rowsOnPage_ = 0;
  headersOnPage_ = 0;
  mismatchesOnPage_ = 0;
}

std::vector<RawRow> readAllRows(RawRowReader& reader) {
  std::vector<RawRow> rows;
  RawRow row;
  while (reader.next(row)) rows.push_back(row);
  if (rows.empty()) {
    throw ExtractionFailure("document yielded no parseable rows (" + std::to_string(reader.gaps().size()) +
                            " page(s) skipped, " + std::to_string(reader.schemaMismatches().size()) +
                            " schema mismatch(es))");
  }
  spdlog::info("TableExtractor: {} row(s) read, {} header row(s) skipped, {} page gap(s)",
               rows.size(), reader.headerRowsSkipped(), reader.gaps().size());
  return rows;
}
