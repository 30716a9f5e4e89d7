#include "text_normalize.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <sstream>

namespace {

// ASCII base letters for U+00C0..U+00FF.
const char* const kLatin1Fold[64] = {
  "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
  "D", "N", "O", "O", "O", "O", "O", "x", "O", "U", "U", "U", "U", "Y", "TH", "ss",
  "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
  "d", "n", "o", "o", "o", "o", "o", "/", "o", "u", "u", "u", "u", "y", "th", "y",
};

// One base letter per code point for U+0100..U+017F.
const char kLatinExtAFold[] =
  "AaAaAaCcCcCcCcDdDdEeEeEeEeEeGgGgGgGgHhHhIiIiIiIiIiIiJjKkkLlLlLlLlLlNnNnNnnNn"
  "OoOoOoOoRrRrRrSsSsSsSsTtTtTtUuUuUuUuUuUuWwYyYZzZzZzs";

bool isSpaceCodepoint(unsigned char b0, unsigned char b1, unsigned char b2) {
  // U+2000..U+200A, U+202F, U+205F
  if (b0 != 0xE2) return false;
  if (b1 == 0x80 && (b2 <= 0x8A || b2 == 0xAF)) return true;
  if (b1 == 0x81 && b2 == 0x9F) return true;
  return false;
}

// Length of the well-formed UTF-8 sequence starting at i, 0 if there is none.
size_t utf8SequenceLength(const std::string& s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) len = 2;
  else if (c >= 0xE0 && c <= 0xEF) len = 3;
  else if (c >= 0xF0 && c <= 0xF4) len = 4;
  else return 0;
  if (c == 0xE0) lo = 0xA0;
  else if (c == 0xED) hi = 0x9F;  // no surrogates
  else if (c == 0xF0) lo = 0x90;
  else if (c == 0xF4) hi = 0x8F;
  if (i + len > s.size()) return 0;
  for (size_t k = 1; k < len; ++k) {
    unsigned char n = static_cast<unsigned char>(s[i+k]);
    if (n < (k == 1 ? lo : 0x80) || n > (k == 1 ? hi : 0xBF)) return 0;
  }
  return len;
}

void appendLatin1(std::string& out, unsigned char c) {
  out.push_back(static_cast<char>(0xC0 | (c >> 6)));
  out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
}

} // namespace

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string cleanCellText(const std::string& s) {
  std::string spaced;
  spaced.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      if (c == '\t' || c == '\n' || c == '\r') spaced.push_back(' ');
      else if (c >= 0x20 && c != 0x7F) spaced.push_back(s[i]);
      continue;
    }
    size_t len = utf8SequenceLength(s, i);
    if (len == 0) {
      // stray byte: read it as Latin-1
      if (c == 0xA0) spaced.push_back(' ');
      else if (c >= 0xA0 && c != 0xAD) appendLatin1(spaced, c);
      continue;
    }
    unsigned char n1 = static_cast<unsigned char>(s[i+1]);
    if (c == 0xC2 && n1 == 0xA0) {
      spaced.push_back(' ');
    } else if (c == 0xC2 && (n1 == 0xAD || n1 < 0xA0)) {
      // soft hyphen, C1 controls
    } else if (c == 0xEF && n1 == 0xBF && static_cast<unsigned char>(s[i+2]) == 0xBD) {
      // U+FFFD
    } else if (len == 3 && isSpaceCodepoint(c, n1, static_cast<unsigned char>(s[i+2]))) {
      spaced.push_back(' ');
    } else {
      spaced.append(s, i, len);
    }
    i += len - 1;
  }

  std::string out;
  out.reserve(spaced.size());
  bool pendingSpace = false;
  for (char ch : spaced) {
    if (ch == ' ') {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) out.push_back(' ');
    pendingSpace = false;
    out.push_back(ch);
  }
  return out;
}

std::string foldDiacritics(const std::string& utf8) {
  std::string out;
  out.reserve(utf8.size());
  for (size_t i = 0; i < utf8.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(utf8[i]);
    if (c >= 0xC2 && c <= 0xC5 && i + 1 < utf8.size()) {
      unsigned char n = static_cast<unsigned char>(utf8[i+1]);
      if ((n & 0xC0) == 0x80) {
        unsigned int cp = ((c & 0x1Fu) << 6) | (n & 0x3Fu);
        if (cp >= 0xC0 && cp <= 0xFF) {
          out += kLatin1Fold[cp - 0xC0];
          i++;
          continue;
        }
        if (cp >= 0x100 && cp <= 0x17F) {
          out.push_back(kLatinExtAFold[cp - 0x100]);
          i++;
          continue;
        }
      }
    }
    out.push_back(utf8[i]);
  }
  return out;
}

std::string normalizeForMatch(const std::string& s) {
  std::string folded = foldDiacritics(cleanCellText(s));
  std::string out;
  out.reserve(folded.size());
  bool pendingSpace = false;
  for (char ch : folded) {
    unsigned char c = static_cast<unsigned char>(ch);
    bool keep = std::isalnum(c) || c >= 0x80;
    if (!keep) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) out.push_back(' ');
    pendingSpace = false;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
  std::vector<std::string> tokens;
  std::istringstream in(normalized);
  std::string tok;
  while (in >> tok) tokens.push_back(tok);
  return tokens;
}

std::string slugify(const std::string& s) {
  std::string slug = normalizeForMatch(s);
  std::replace(slug.begin(), slug.end(), ' ', '-');
  return slug;
}

size_t levenshteinDistance(const std::string& a, const std::string& b) {
  const size_t na = a.size();
  const size_t nb = b.size();
  if (na == 0) return nb;
  if (nb == 0) return na;
  std::vector<size_t> prev(nb + 1), cur(nb + 1);
  for (size_t j = 0; j <= nb; ++j) prev[j] = j;
  for (size_t i = 1; i <= na; ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= nb; ++j) {
      size_t cost = (a[i-1] == b[j-1]) ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j-1] + 1, prev[j-1] + cost});
    }
    prev.swap(cur);
  }
  return prev[nb];
}

double levenshteinRatio(const std::string& a, const std::string& b) {
  const size_t longest = std::max(a.size(), b.size());
  if (longest == 0) return 1.0;
  return 1.0 - static_cast<double>(levenshteinDistance(a, b)) / static_cast<double>(longest);
}

double tokenSetRatio(const std::string& a, const std::string& b) {
  std::vector<std::string> ta = tokenize(a);
  std::vector<std::string> tb = tokenize(b);
  std::set<std::string> sa(ta.begin(), ta.end());
  std::set<std::string> sb(tb.begin(), tb.end());
  if (sa.empty() || sb.empty()) return (sa.empty() && sb.empty()) ? 1.0 : 0.0;

  auto join = [](const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
      if (!out.empty()) out += ' ';
      out += p;
    }
    return out;
  };

  std::vector<std::string> common, onlyA, onlyB;
  std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(common));
  std::set_difference(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(onlyA));
  std::set_difference(sb.begin(), sb.end(), sa.begin(), sa.end(), std::back_inserter(onlyB));

  const std::string base = join(common);
  std::string withA = base, withB = base;
  if (!onlyA.empty()) withA += (base.empty() ? "" : " ") + join(onlyA);
  if (!onlyB.empty()) withB += (base.empty() ? "" : " ") + join(onlyB);

  double best = levenshteinRatio(withA, withB);
  if (!base.empty()) {
    best = std::max({best, levenshteinRatio(base, withA), levenshteinRatio(base, withB)});
  }
  return best;
}

double similarityNormalized(const std::string& na, const std::string& nb) {
  if (na.empty() || nb.empty()) return 0.0;
  if (na == nb) return 1.0;
  // Subset matches rank just below an identical name.
  return std::max(levenshteinRatio(na, nb), 0.95 * tokenSetRatio(na, nb));
}

double similarity(const std::string& a, const std::string& b) {
  return similarityNormalized(normalizeForMatch(a), normalizeForMatch(b));
}
