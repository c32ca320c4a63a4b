#include "ArchiveRecord.hpp"
#include "core/Errors.hpp"

namespace alib {

const char* to_string(UploadStatus s) {
  switch (s) {
    case UploadStatus::None:       return "NONE";
    case UploadStatus::Pending:    return "PENDING";
    case UploadStatus::InProgress: return "IN_PROGRESS";
    case UploadStatus::Completed:  return "COMPLETED";
    case UploadStatus::Failed:     return "FAILED";
  }
  return "NONE";
}

const char* to_string(RetrievalStatus s) {
  switch (s) {
    case RetrievalStatus::Pending:    return "PENDING";
    case RetrievalStatus::InProgress: return "IN_PROGRESS";
    case RetrievalStatus::Ready:      return "READY";
    case RetrievalStatus::Expired:    return "EXPIRED";
    case RetrievalStatus::Failed:     return "FAILED";
  }
  return "PENDING";
}

UploadStatus upload_status_from(const std::string& s) {
  if (s == "NONE")        return UploadStatus::None;
  if (s == "PENDING")     return UploadStatus::Pending;
  if (s == "IN_PROGRESS") return UploadStatus::InProgress;
  if (s == "COMPLETED")   return UploadStatus::Completed;
  if (s == "FAILED")      return UploadStatus::Failed;
  throw ValidationError("unknown upload status: " + s);
}

RetrievalStatus retrieval_status_from(const std::string& s) {
  if (s == "PENDING")     return RetrievalStatus::Pending;
  if (s == "IN_PROGRESS") return RetrievalStatus::InProgress;
  if (s == "READY")       return RetrievalStatus::Ready;
  if (s == "EXPIRED")     return RetrievalStatus::Expired;
  if (s == "FAILED")      return RetrievalStatus::Failed;
  throw ValidationError("unknown retrieval status: " + s);
}

} // namespace alib
