#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

// Replaces tabs/newlines/non-breaking and thin spaces with a plain space, drops
// control characters, soft hyphens and U+FFFD, then collapses runs of spaces.
std::string cleanCellText(const std::string& s);

// Maps Latin-1 and Latin Extended-A letters onto their ASCII base letter.
// Other code points pass through unchanged.
std::string foldDiacritics(const std::string& utf8);

// Lower-case, diacritic-free, punctuation replaced by single spaces.
std::string normalizeForMatch(const std::string& s);

std::vector<std::string> tokenize(const std::string& normalized);

// "Sukuma Wiki (raw)" -> "sukuma-wiki-raw"
std::string slugify(const std::string& s);

size_t levenshteinDistance(const std::string& a, const std::string& b);

// 1 - distance / longer length, in [0, 1]. Both empty -> 1.
double levenshteinRatio(const std::string& a, const std::string& b);

// Order-insensitive comparison on token sets; a subset scores 1.
double tokenSetRatio(const std::string& a, const std::string& b);

// Score used by every fuzzy lookup, on already normalized strings.
double similarityNormalized(const std::string& na, const std::string& nb);

// normalizeForMatch() on both sides, then similarityNormalized().
double similarity(const std::string& a, const std::string& b);
