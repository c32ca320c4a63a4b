#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/ledger/ArchiveRecord.hpp"
#include "core/remote/ArchiveRemote.hpp"

namespace alib {

enum class TransferStrategy { SinglePart, MultiPart };

// PENDING -> IN_PROGRESS -> [CANCELLING ->] COMPLETED | FAILED
enum class UploadJobState { Pending, InProgress, Cancelling, Completed, Failed };

const char* to_string(TransferStrategy s);
const char* to_string(UploadJobState s);
TransferStrategy strategy_from(const std::string& s);
UploadJobState upload_job_state_from(const std::string& s);

inline bool is_terminal(UploadJobState s) {
  return s == UploadJobState::Completed || s == UploadJobState::Failed;
}

struct PartUpload {
  uint32_t    index = 0;
  uint64_t    offset = 0;
  uint64_t    length = 0;
  std::string checksum;
  bool        confirmed = false;
};

struct UploadJob {
  std::string      id;
  std::string      archive_id;
  TransferStrategy strategy = TransferStrategy::SinglePart;
  UploadJobState   state = UploadJobState::Pending;
  uint64_t         total_size = 0;
  uint64_t         part_size = 0;
  std::optional<std::string> handle;
  int              attempts = 0;
  std::string      last_error;
  std::optional<std::string> remote_archive_id;
  bool             completion_requested = false;  // completeUpload was sent at least once
  int64_t          created_at = 0;
  int64_t          updated_at = 0;
  std::vector<PartUpload> parts;
};

// Retrieval jobs reuse RetrievalStatus:
// PENDING -> IN_PROGRESS -> READY -> EXPIRED, or FAILED.
struct RetrievalJob {
  std::string     id;
  std::string     archive_id;
  std::string     remote_job_id;
  RetrievalStatus state = RetrievalStatus::Pending;
  ByteRange       range;
  int64_t         requested_at = 0;
  int64_t         updated_at = 0;
};

enum class JobKind { Upload, Retrieval };
const char* to_string(JobKind k);

struct Transition {
  int64_t     seq = 0;
  std::string job_id;
  JobKind     kind = JobKind::Upload;
  std::optional<std::string> from;
  std::string to;
  int64_t     at = 0;
  std::string source;
};

struct AnomalyRecord {
  int64_t     seq = 0;
  std::string job_id;
  std::string recorded_state;
  std::string remote_state;
  std::string detail;
  int64_t     at = 0;
};

struct DanglingUpload {
  std::string handle;
  std::string job_id;
  std::string last_error;
  int64_t     at = 0;
};

struct ReconcileResult {
  std::string job_id;
  JobKind     kind = JobKind::Upload;
  std::string before;
  std::string after;
  bool        advanced = false;
  std::optional<AnomalyRecord> anomaly;
};

} // namespace alib
