#include <engram/privacy.hpp>

#include <engram/normalize.hpp>

#include <algorithm>

namespace engram {

namespace {

struct Marker {
  const char* text;
  PrivacyClass privacy_class;
};

// Matched against whitespace-collapsed, lowercased content.
constexpr Marker kMarkers[] = {
    {"[private]", PrivacyClass::kPrivate},
    {"#private", PrivacyClass::kPrivate},
    {"[secret]", PrivacyClass::kPrivate},
    {"do not share", PrivacyClass::kPrivate},
    {"off the record", PrivacyClass::kPrivate},
    {"[sensitive]", PrivacyClass::kSensitive},
    {"#sensitive", PrivacyClass::kSensitive},
    {"[personal]", PrivacyClass::kSensitive},
    {"confidential", PrivacyClass::kSensitive},
};

}  // namespace

bool PassesLuhn(std::string_view s) {
  int sum = 0;
  int count = 0;
  bool dbl = false;
  for (auto it = s.rbegin(); it != s.rend(); ++it) {
    if (*it < '0' || *it > '9') continue;
    int d = *it - '0';
    if (dbl) {
      d *= 2;
      if (d > 9) d -= 9;
    }
    sum += d;
    dbl = !dbl;
    ++count;
  }
  return count >= 13 && count <= 19 && sum % 10 == 0;
}

PrivacyClassifier::PrivacyClassifier() {
  const auto icase = std::regex::ECMAScript | std::regex::icase;
  const auto cs = std::regex::ECMAScript;

  // Credentials and key material
  patterns_.push_back({"api_key", std::regex(R"(\bsk-[A-Za-z0-9_-]{16,})", cs),
                       PrivacyClass::kPrivate});
  patterns_.push_back({"aws_access_key", std::regex(R"(\bAKIA[0-9A-Z]{16}\b)", cs),
                       PrivacyClass::kPrivate});
  patterns_.push_back({"github_token",
                       std::regex(R"(\bgh[pousr]_[A-Za-z0-9]{30,})", cs),
                       PrivacyClass::kPrivate});
  patterns_.push_back({"slack_token",
                       std::regex(R"(\bxox[abprs]-[A-Za-z0-9-]{10,})", cs),
                       PrivacyClass::kPrivate});
  patterns_.push_back({"private_key",
                       std::regex(R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)", cs),
                       PrivacyClass::kPrivate});
  patterns_.push_back(
      {"credential_assignment",
       std::regex(R"(\b(password|passwd|pwd|secret|api[_-]?key|access[_-]?token)\s*[:=]\s*\S+)",
                  icase),
       PrivacyClass::kPrivate});
  patterns_.push_back({"bearer_token",
                       std::regex(R"(\bbearer\s+[A-Za-z0-9._~+/-]{20,})", icase),
                       PrivacyClass::kPrivate});
  patterns_.push_back(
      {"jwt",
       std::regex(R"(\beyJ[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,})", cs),
       PrivacyClass::kPrivate});
  patterns_.push_back({"ssn", std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)", cs),
                       PrivacyClass::kPrivate});

  // Personal data
  patterns_.push_back(
      {"email",
       std::regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", cs),
       PrivacyClass::kSensitive});
  patterns_.push_back(
      {"phone",
       std::regex(R"((\+\d{1,3}[ .-]?)?\(?\b\d{3}\)?[ .-]\d{3}[ .-]\d{4}\b)", cs),
       PrivacyClass::kSensitive});
  patterns_.push_back({"card_number", std::regex(R"(\b(\d[ -]?){12,18}\d\b)", cs),
                       PrivacyClass::kSensitive, /*luhn=*/true});
}

PrivacyClass PrivacyClassifier::Classify(std::string_view content,
                                         std::optional<PrivacyClass> hint) const {
  PrivacySignals signals;
  return ClassifyWithSignals(content, hint, &signals);
}

PrivacyClass PrivacyClassifier::ClassifyWithSignals(
    std::string_view content, std::optional<PrivacyClass> hint,
    PrivacySignals* signals) const {
  signals->hint = hint;
  signals->markers.clear();
  signals->detections.clear();

  // Markers and patterns are always collected so callers can see what the
  // hint overrode.
  std::optional<PrivacyClass> marked;
  const std::string folded =
      internal::Normalize(content, NormalizationMode::kASCII);
  for (const auto& m : kMarkers) {
    if (folded.find(m.text) != std::string::npos) {
      signals->markers.emplace_back(m.text);
      marked = marked ? std::max(*marked, m.privacy_class) : m.privacy_class;
    }
  }

  std::optional<PrivacyClass> detected;
  const char* begin = content.data();
  const char* end = content.data() + content.size();
  for (const auto& p : patterns_) {
    bool hit = false;
    if (p.luhn) {
      for (std::cregex_iterator it(begin, end, p.re), last; it != last; ++it) {
        if (PassesLuhn(it->str())) {
          hit = true;
          break;
        }
      }
    } else {
      hit = std::regex_search(begin, end, p.re);
    }
    if (hit) {
      signals->detections.push_back(p.name);
      detected = detected ? std::max(*detected, p.privacy_class) : p.privacy_class;
    }
  }

  // Only the hint overrides. A marker can raise the class but never lower
  // what a pattern detected.
  PrivacyClass result = PrivacyClass::kPublic;
  if (hint) {
    result = *hint;
  } else {
    if (marked) result = std::max(result, *marked);
    if (detected) result = std::max(result, *detected);
  }
  signals->result = result;
  return result;
}

}  // namespace engram
