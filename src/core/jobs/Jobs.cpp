#include "Jobs.hpp"
#include "core/Errors.hpp"

namespace alib {

const char* to_string(TransferStrategy s) {
  return s == TransferStrategy::MultiPart ? "MULTI_PART" : "SINGLE_PART";
}

const char* to_string(UploadJobState s) {
  switch (s) {
    case UploadJobState::Pending:    return "PENDING";
    case UploadJobState::InProgress: return "IN_PROGRESS";
    case UploadJobState::Cancelling: return "CANCELLING";
    case UploadJobState::Completed:  return "COMPLETED";
    case UploadJobState::Failed:     return "FAILED";
  }
  return "PENDING";
}

const char* to_string(JobKind k) {
  return k == JobKind::Retrieval ? "RETRIEVAL" : "UPLOAD";
}

const char* to_string(RemoteJobState s) {
  switch (s) {
    case RemoteJobState::InProgress: return "InProgress";
    case RemoteJobState::Succeeded:  return "Succeeded";
    case RemoteJobState::Failed:     return "Failed";
    case RemoteJobState::Expired:    return "Expired";
    case RemoteJobState::NotFound:   return "NotFound";
  }
  return "InProgress";
}

TransferStrategy strategy_from(const std::string& s) {
  if (s == "SINGLE_PART") return TransferStrategy::SinglePart;
  if (s == "MULTI_PART")  return TransferStrategy::MultiPart;
  throw ValidationError("unknown transfer strategy: " + s);
}

UploadJobState upload_job_state_from(const std::string& s) {
  if (s == "PENDING")     return UploadJobState::Pending;
  if (s == "IN_PROGRESS") return UploadJobState::InProgress;
  if (s == "CANCELLING")  return UploadJobState::Cancelling;
  if (s == "COMPLETED")   return UploadJobState::Completed;
  if (s == "FAILED")      return UploadJobState::Failed;
  throw ValidationError("unknown upload job state: " + s);
}

} // namespace alib
