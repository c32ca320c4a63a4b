#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace alib {

struct FileEntry {
  std::string path;   // relative to the archive's source path
  uint64_t    size = 0;
};

enum class UploadStatus { None, Pending, InProgress, Completed, Failed };
enum class RetrievalStatus { Pending, InProgress, Ready, Expired, Failed };

const char* to_string(UploadStatus s);
const char* to_string(RetrievalStatus s);
UploadStatus upload_status_from(const std::string& s);
RetrievalStatus retrieval_status_from(const std::string& s);

inline bool is_terminal(UploadStatus s) {
  return s == UploadStatus::Completed || s == UploadStatus::Failed;
}
inline bool is_terminal(RetrievalStatus s) {
  return s == RetrievalStatus::Expired || s == RetrievalStatus::Failed;
}

struct ArchiveRecord {
  std::string id;
  std::string source_path;
  int64_t     created_at = 0;
  std::string description;
  std::vector<FileEntry> files;
  std::string payload_checksum;   // tree hash, hex
  uint64_t    payload_size = 0;
  UploadStatus upload_status = UploadStatus::None;
  std::optional<RetrievalStatus> retrieval_status;
  std::optional<std::string> remote_archive_id;
  int64_t     updated_at = 0;
};

// Input to Ledger::createRecord.
struct RecordDraft {
  std::string source_path;
  std::string description;
  std::vector<FileEntry> files;
  std::string payload_checksum;
  uint64_t    payload_size = 0;
};

} // namespace alib
