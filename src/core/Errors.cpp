#include "Errors.hpp"

#include <sstream>
#include <utility>

namespace alib {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:            return "ValidationError";
    case ErrorKind::AmbiguousReference:    return "AmbiguousReferenceError";
    case ErrorKind::NotFound:              return "NotFoundError";
    case ErrorKind::ChecksumMismatch:      return "ChecksumMismatchError";
    case ErrorKind::TransientNetwork:      return "TransientNetworkError";
    case ErrorKind::RemoteProtocol:        return "RemoteProtocolError";
    case ErrorKind::IncompleteUpload:      return "IncompleteUploadError";
    case ErrorKind::ReconciliationAnomaly: return "ReconciliationAnomaly";
    case ErrorKind::Cancelled:             return "Cancelled";
    case ErrorKind::JobFailed:             return "JobFailedError";
  }
  return "ArchiveError";
}

static std::string ambiguous_message(const std::string& prefix,
                                     const std::vector<std::string>& candidates) {
  std::ostringstream oss;
  oss << "reference '" << prefix << "' is ambiguous, candidates:";
  for (const auto& c : candidates) oss << ' ' << c;
  return oss.str();
}

AmbiguousReferenceError::AmbiguousReferenceError(const std::string& prefix,
                                                 std::vector<std::string> candidates)
  : ArchiveError(ErrorKind::AmbiguousReference, ambiguous_message(prefix, candidates)),
    prefix_(prefix),
    candidates_(std::move(candidates)) {}

ChecksumMismatchError::ChecksumMismatchError(const std::string& expected,
                                             const std::string& actual)
  : ArchiveError(ErrorKind::ChecksumMismatch,
                 "checksum mismatch: expected " + expected + ", got " + actual),
    expected_(expected),
    actual_(actual) {}

JobFailedError::JobFailedError(const std::string& job_id, int attempts,
                               const std::string& last_error, ErrorKind cause)
  : ArchiveError(ErrorKind::JobFailed,
                 "job " + job_id + " failed after " + std::to_string(attempts) +
                 " attempt(s): " + last_error),
    job_id_(job_id),
    attempts_(attempts),
    last_error_(last_error),
    cause_(cause) {}

} // namespace alib
