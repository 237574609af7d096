#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace engram {

/**
 * Result of a fallible engram operation.
 *
 * Follows the shape of rocksdb::Status (which the index layer returns) but
 * carries the memory subsystem's own error taxonomy:
 *
 *  - IntegrityError: append-only violation. Always surfaced to the caller.
 *  - Corruption: a specific frame or record is unreadable.
 *  - Rejected: policy refusal (e.g. indexing private content). Expected.
 *  - CollaboratorUnavailable: embedding or vector-search failure/timeout.
 *  - ConfigError: invalid configuration, fatal at startup.
 */
class Status {
 public:
  enum class Code : unsigned char {
    kOk = 0,
    kNotFound,
    kIntegrityError,
    kCorruption,
    kRejected,
    kCollaboratorUnavailable,
    kConfigError,
    kInvalidArgument,
    kIOError,
    kCancelled,
  };

  Status() = default;

  static Status OK() { return Status(); }
  static Status NotFound(std::string_view msg = {}) {
    return Status(Code::kNotFound, msg);
  }
  static Status IntegrityError(std::string_view msg = {}) {
    return Status(Code::kIntegrityError, msg);
  }
  static Status Corruption(std::string_view msg = {}) {
    return Status(Code::kCorruption, msg);
  }
  static Status Rejected(std::string_view msg = {}) {
    return Status(Code::kRejected, msg);
  }
  static Status CollaboratorUnavailable(std::string_view msg = {}) {
    return Status(Code::kCollaboratorUnavailable, msg);
  }
  static Status ConfigError(std::string_view msg = {}) {
    return Status(Code::kConfigError, msg);
  }
  static Status InvalidArgument(std::string_view msg = {}) {
    return Status(Code::kInvalidArgument, msg);
  }
  static Status IOError(std::string_view msg = {}) {
    return Status(Code::kIOError, msg);
  }
  static Status Cancelled(std::string_view msg = {}) {
    return Status(Code::kCancelled, msg);
  }

  bool ok() const { return code_ == Code::kOk; }
  bool IsNotFound() const { return code_ == Code::kNotFound; }
  bool IsIntegrityError() const { return code_ == Code::kIntegrityError; }
  bool IsCorruption() const { return code_ == Code::kCorruption; }
  bool IsRejected() const { return code_ == Code::kRejected; }
  bool IsCollaboratorUnavailable() const {
    return code_ == Code::kCollaboratorUnavailable;
  }
  bool IsConfigError() const { return code_ == Code::kConfigError; }
  bool IsInvalidArgument() const { return code_ == Code::kInvalidArgument; }
  bool IsIOError() const { return code_ == Code::kIOError; }
  bool IsCancelled() const { return code_ == Code::kCancelled; }

  Code code() const { return code_; }
  const std::string& message() const { return msg_; }

  /** Human readable form, e.g. "Corruption: checksum mismatch at seq 12". */
  std::string ToString() const;

 private:
  Status(Code code, std::string_view msg) : code_(code), msg_(msg) {}

  Code code_ = Code::kOk;
  std::string msg_;
};

// Low-cardinality label for metrics and span attributes.
std::string_view StatusKind(const Status& s);

}  // namespace engram
