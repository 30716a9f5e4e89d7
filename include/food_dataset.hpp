#pragma once

#include "food_record.hpp"

#include <string>
#include <vector>

// Marker written for a not-available nutrient value.
extern const char* const kNotAvailable;

// Fixed leading columns, then the union of micronutrient keys in sorted order.
std::vector<std::string> datasetColumns(const std::vector<FoodRecord>& records);

// Writes the whole dataset to a temporary file beside path and renames it over
// path, so readers see either the previous file or the complete new one.
void writeDatasetAtomically(const std::vector<FoodRecord>& records, const std::string& path);

// Throws DatasetError on a missing file, a missing required column, an unknown
// food group or an unparseable number.
std::vector<FoodRecord> readDataset(const std::string& path);
