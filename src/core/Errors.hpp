#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace alib {

enum class ErrorKind {
  Validation,
  AmbiguousReference,
  NotFound,
  ChecksumMismatch,
  TransientNetwork,
  RemoteProtocol,
  IncompleteUpload,
  ReconciliationAnomaly,
  Cancelled,
  JobFailed
};

const char* to_string(ErrorKind kind);

// Root of every error the engine raises on purpose.
class ArchiveError : public std::runtime_error {
public:
  ArchiveError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ValidationError : public ArchiveError {
public:
  explicit ValidationError(const std::string& what)
    : ArchiveError(ErrorKind::Validation, what) {}
};

class AmbiguousReferenceError : public ArchiveError {
public:
  AmbiguousReferenceError(const std::string& prefix, std::vector<std::string> candidates);
  const std::string& prefix() const { return prefix_; }
  const std::vector<std::string>& candidates() const { return candidates_; }

private:
  std::string prefix_;
  std::vector<std::string> candidates_;
};

class NotFoundError : public ArchiveError {
public:
  explicit NotFoundError(const std::string& what)
    : ArchiveError(ErrorKind::NotFound, what) {}
};

// Data corruption: never retried.
class ChecksumMismatchError : public ArchiveError {
public:
  ChecksumMismatchError(const std::string& expected, const std::string& actual);
  const std::string& expected() const { return expected_; }
  const std::string& actual() const { return actual_; }

private:
  std::string expected_;
  std::string actual_;
};

class TransientNetworkError : public ArchiveError {
public:
  explicit TransientNetworkError(const std::string& what)
    : ArchiveError(ErrorKind::TransientNetwork, what) {}
};

// Quota, permission or malformed-request answers from the remote.
class RemoteProtocolError : public ArchiveError {
public:
  explicit RemoteProtocolError(const std::string& what, int status = 0)
    : ArchiveError(ErrorKind::RemoteProtocol, what), status_(status) {}
  int status() const { return status_; }

private:
  int status_;
};

class IncompleteUploadError : public ArchiveError {
public:
  explicit IncompleteUploadError(const std::string& what)
    : ArchiveError(ErrorKind::IncompleteUpload, what) {}
};

class ReconciliationAnomaly : public ArchiveError {
public:
  ReconciliationAnomaly(const std::string& job_id, const std::string& what)
    : ArchiveError(ErrorKind::ReconciliationAnomaly, what), job_id_(job_id) {}
  const std::string& jobId() const { return job_id_; }

private:
  std::string job_id_;
};

// Raised once a job has crossed into FAILED.
class JobFailedError : public ArchiveError {
public:
  JobFailedError(const std::string& job_id, int attempts,
                 const std::string& last_error, ErrorKind cause);
  const std::string& jobId() const { return job_id_; }
  int attempts() const { return attempts_; }
  const std::string& lastError() const { return last_error_; }
  ErrorKind cause() const { return cause_; }

private:
  std::string job_id_;
  int attempts_;
  std::string last_error_;
  ErrorKind cause_;
};

} // namespace alib
