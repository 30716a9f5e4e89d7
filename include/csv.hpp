#pragma once

#include <string>
#include <vector>

// Quotes a field when it contains a comma, quote or newline.
std::string formatCsvRow(const std::vector<std::string>& row);

// Splits one CSV line, honouring double-quoted fields and "" escapes.
std::vector<std::string> parseCsvRow(const std::string& line);

// Reads every non-empty line of a CSV file. Throws std::runtime_error when
// the file cannot be opened.
std::vector<std::vector<std::string>> readCsvFile(const std::string& path);
