#include <engram/status.hpp>

namespace engram {

std::string Status::ToString() const {
  std::string out(StatusKind(*this));
  if (!msg_.empty()) {
    out += ": ";
    out += msg_;
  }
  return out;
}

std::string_view StatusKind(const Status& s) {
  switch (s.code()) {
    case Status::Code::kOk:
      return "OK";
    case Status::Code::kNotFound:
      return "NotFound";
    case Status::Code::kIntegrityError:
      return "IntegrityError";
    case Status::Code::kCorruption:
      return "Corruption";
    case Status::Code::kRejected:
      return "Rejected";
    case Status::Code::kCollaboratorUnavailable:
      return "CollaboratorUnavailable";
    case Status::Code::kConfigError:
      return "ConfigError";
    case Status::Code::kInvalidArgument:
      return "InvalidArgument";
    case Status::Code::kIOError:
      return "IOError";
    case Status::Code::kCancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace engram
