#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <engram/types.hpp>

namespace engram {

/** Why a piece of content received its class. */
struct PrivacySignals {
  std::optional<PrivacyClass> hint;
  std::vector<std::string> markers;     // explicit in-content markers
  std::vector<std::string> detections;  // names of matched secret/PII patterns
  PrivacyClass result = PrivacyClass::kPublic;
};

/**
 * Maps content to a PrivacyClass. Pure and deterministic; safe to share
 * between threads once constructed.
 *
 * A declared hint decides outright. Without one, the result is the most
 * restrictive class among:
 *   - explicit markers in the content ("[private]", "#sensitive", ...)
 *   - detected patterns: credentials and keys => private,
 *     personal data (emails, phone numbers, card numbers) => sensitive
 *   - public
 *
 * A "[sensitive]" marker therefore never lowers a detected credential.
 */
class PrivacyClassifier {
 public:
  PrivacyClassifier();

  PrivacyClass Classify(std::string_view content,
                        std::optional<PrivacyClass> hint = std::nullopt) const;

  PrivacyClass ClassifyWithSignals(std::string_view content,
                                   std::optional<PrivacyClass> hint,
                                   PrivacySignals* signals) const;

 private:
  struct Pattern {
    std::string name;
    std::regex re;
    PrivacyClass privacy_class;
    bool luhn = false;  // matches must also pass a Luhn check
  };

  std::vector<Pattern> patterns_;
};

// Luhn checksum over the decimal digits in s (other characters ignored).
bool PassesLuhn(std::string_view s);

}  // namespace engram
