#pragma once

#include <string>
#include <vector>

struct WordBox {
  int pageNumber;
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

struct BboxDocument {
  std::vector<int> pages;  // every page the document announced, in order
  std::vector<WordBox> words;
};

// One table region of a page. Header rows are kept; cells are never dropped,
// a blank cell is an empty string so every row has columnCount() cells.
struct Table {
  int pageNumber;
  int regionIndex;
  std::vector<std::vector<std::string>> rows;

  size_t columnCount() const { return rows.empty() ? 0 : rows.front().size(); }
};

struct PageTables {
  int pageNumber;
  std::vector<Table> tables;
};

struct ExtractionOptions {
  int firstPage = 1;
  int lastPage = -1;        // -1: until the end of the document
  unsigned workers = 0;     // 0: hardware concurrency
  double regionGapFactor = 2.5;
};

// The versioned column layout the document is expected to follow.
struct TableSchema {
  std::string version;
  std::vector<std::string> columns;
  std::vector<std::string> headerTokens;
  int minHeaderHits = 2;
};

// Runs `pdftotext -bbox-layout` and returns its XHTML output.
// Throws ExtractionFailure when the tool is missing or fails.
std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage);

// Parses `pdftotext -bbox-layout` output. Pages without a number attribute are
// numbered consecutively from firstPage.
BboxDocument parseBboxLayout(const std::string& xmlish, int firstPage = 1);

// Clusters one page's words into rows, splits the page into table regions at
// large vertical gaps and recovers each region's columns.
std::vector<Table> extractPageTables(int pageNumber, std::vector<WordBox> words, const ExtractionOptions& options);

// Pages are clustered in parallel and returned in document order.
std::vector<PageTables> extractTablesFromDocument(const BboxDocument& doc, const ExtractionOptions& options);

std::vector<PageTables> extractTablesFromPdf(const std::string& pdfPath, const ExtractionOptions& options);

// Write tables into CSV files in outDir as table_<page>_<index>.csv
void writeTablesAsCsv(const std::vector<PageTables>& pages, const std::string& outDir);

struct RawRow {
  int pageNumber;
  int tableIndex;
  int rowIndex;
  std::vector<std::string> cells;

  std::string origin() const;
};

struct ExtractionGap {
  int pageNumber;
  std::string reason;
};

bool isHeaderRow(const std::vector<std::string>& cells, const TableSchema& schema);

// Lazily walks the extracted tables in page order, yielding data rows. Header
// rows are skipped wherever they repeat; tables whose column count differs
// from the schema are reported and skipped; a page that yields no data row is
// recorded as a gap.
class RawRowReader {
public:
  RawRowReader(std::vector<PageTables> pages, TableSchema schema);

  bool next(RawRow& row);

  // Complete once next() has returned false.
  const std::vector<ExtractionGap>& gaps() const { return gaps_; }
  const std::vector<std::string>& schemaMismatches() const { return mismatches_; }
  size_t headerRowsSkipped() const { return headerRows_; }
  size_t rowsRead() const { return rowsRead_; }

private:
  void finishPage();

  std::vector<PageTables> pages_;
  TableSchema schema_;
  size_t pageIdx_ = 0;
  size_t tableIdx_ = 0;
  size_t rowIdx_ = 0;
  bool tableChecked_ = false;
  size_t rowsOnPage_ = 0;
  size_t headersOnPage_ = 0;
  size_t mismatchesOnPage_ = 0;
  size_t headerRows_ = 0;
  size_t rowsRead_ = 0;
  std::vector<ExtractionGap> gaps_;
  std::vector<std::string> mismatches_;
};

// Drains the reader. Throws ExtractionFailure when no data row was found.
std::vector<RawRow> readAllRows(RawRowReader& reader);
