#include <engram/types.hpp>

namespace engram {

std::string_view PrivacyClassName(PrivacyClass c) {
  switch (c) {
    case PrivacyClass::kPublic:
      return "public";
    case PrivacyClass::kSensitive:
      return "sensitive";
    case PrivacyClass::kPrivate:
      return "private";
  }
  return "private";
}

bool ParsePrivacyClass(std::string_view s, PrivacyClass* out) {
  if (s == "public") {
    *out = PrivacyClass::kPublic;
  } else if (s == "sensitive") {
    *out = PrivacyClass::kSensitive;
  } else if (s == "private") {
    *out = PrivacyClass::kPrivate;
  } else {
    return false;
  }
  return true;
}

std::string_view MemoryTypeName(MemoryType t) {
  switch (t) {
    case MemoryType::kConversation:
      return "conversation";
    case MemoryType::kTechnical:
      return "technical";
    case MemoryType::kInsight:
      return "insight";
    case MemoryType::kPattern:
      return "pattern";
    case MemoryType::kFact:
      return "fact";
  }
  return "conversation";
}

bool ParseMemoryType(std::string_view s, MemoryType* out) {
  if (s == "conversation") {
    *out = MemoryType::kConversation;
  } else if (s == "technical") {
    *out = MemoryType::kTechnical;
  } else if (s == "insight") {
    *out = MemoryType::kInsight;
  } else if (s == "pattern") {
    *out = MemoryType::kPattern;
  } else if (s == "fact") {
    *out = MemoryType::kFact;
  } else {
    return false;
  }
  return true;
}

std::string RecordIdForFrame(std::string_view frame_id) {
  return "m-" + std::string(frame_id.substr(0, 32));
}

}  // namespace engram
