#include "csv.hpp"

#include <fstream>
#include <stdexcept>

std::string formatCsvRow(const std::vector<std::string>& row) {
  std::string line;
  for (size_t i = 0; i < row.size(); ++i) {
    const std::string& cell = row[i];
    bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                      cell.find('\n') != std::string::npos;
    if (needQuotes) {
      line += '"';
      for (char ch : cell) {
        if (ch == '"') line += '"';
        line += ch;
      }
      line += '"';
    } else {
      line += cell;
    }
    if (i + 1 < row.size()) line += ',';
  }
  return line;
}

std::vector<std::string> parseCsvRow(const std::string& line) {
  std::vector<std::string> out;
  std::string cell;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];
    if (quoted) {
      if (ch == '"') {
        if (i + 1 < line.size() && line[i+1] == '"') {
          cell += '"';
          i++;
        } else {
          quoted = false;
        }
      } else {
        cell += ch;
      }
    } else if (ch == '"') {
      quoted = true;
    } else if (ch == ',') {
      out.push_back(cell);
      cell.clear();
    } else if (ch != '\r') {
      cell += ch;
    }
  }
  out.push_back(cell);
  return out;
}

std::vector<std::vector<std::string>> readCsvFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open CSV file: " + path);
  std::vector<std::vector<std::string>> rows;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    rows.push_back(parseCsvRow(line));
  }
  return rows;
}
