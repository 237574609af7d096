#include <engram/normalize.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace engram::internal {

namespace {

inline bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

inline char FoldASCII(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool IsWordByte(uint8_t c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c >= 0x80;
}

// Sorted for binary search.
constexpr std::array<std::string_view, 48> kStopwords = {
    "a",     "about", "after", "all",   "also", "an",   "and",  "any",
    "are",   "as",    "at",    "be",    "been", "but",  "by",   "can",
    "did",   "do",    "for",   "from",  "had",  "has",  "have", "how",
    "i",     "if",    "in",    "into",  "is",   "it",   "its",  "of",
    "on",    "or",    "our",   "so",    "that", "the",  "this", "to",
    "was",   "we",    "were",  "what",  "when", "which", "with", "you",
};

}  // namespace

std::string Normalize(std::string_view input, NormalizationMode mode) {
  if (mode == NormalizationMode::kNone || input.empty()) {
    return std::string(input);
  }

  std::string result;
  result.reserve(input.size());

  bool in_whitespace = true;  // Start true to trim leading whitespace
  const bool needs_case_fold = (mode == NormalizationMode::kASCII);

  for (char c : input) {
    if (IsWhitespace(c)) {
      if (!in_whitespace) {
        result += ' ';
        in_whitespace = true;
      }
      continue;
    }
    in_whitespace = false;
    result += needs_case_fold ? FoldASCII(c) : c;
  }

  // Trim trailing whitespace
  while (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }

  return result;
}

std::vector<std::string> Tokenize(std::string_view input) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : input) {
    if (IsWordByte(static_cast<uint8_t>(c))) {
      current += FoldASCII(c);
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

bool IsStopword(std::string_view token) {
  return std::binary_search(kStopwords.begin(), kStopwords.end(), token);
}

}  // namespace engram::internal
