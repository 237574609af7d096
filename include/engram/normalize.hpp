#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace engram {

/** Normalization level for cache keys and lexical matching.
 *  Normalization is applied ONLY to derive keys and tokens;
 *  stored content is never rewritten.
 */
enum class NormalizationMode {
  kNone,        // No normalization (byte-exact)
  kWhitespace,  // Collapse whitespace runs to single space, trim edges
  kASCII        // Whitespace + ASCII case folding (A-Z -> a-z)
};

namespace internal {

/**
 * Normalize text according to the specified mode.
 *
 * - kNone: Returns input unchanged
 * - kWhitespace: Collapses whitespace, trims edges
 * - kASCII: + ASCII lowercase (A-Z -> a-z)
 *
 * Multi-byte UTF-8 sequences pass through untouched.
 */
std::string Normalize(std::string_view input, NormalizationMode mode);

/**
 * Split into lowercase word tokens. ASCII letters and digits form words;
 * bytes >= 0x80 are kept inside words so non-English text still tokenizes.
 * Everything else separates.
 */
std::vector<std::string> Tokenize(std::string_view input);

// True for very common English words that carry no topical signal.
bool IsStopword(std::string_view token);

}  // namespace internal
}  // namespace engram
