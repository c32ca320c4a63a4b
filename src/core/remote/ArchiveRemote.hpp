#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace alib {

// Inclusive byte range of an archive.
struct ByteRange {
  uint64_t first = 0;
  uint64_t last  = 0;
};

enum class RemoteJobState { InProgress, Succeeded, Failed, Expired, NotFound };
const char* to_string(RemoteJobState s);

struct RemoteJobStatus {
  RemoteJobState state = RemoteJobState::InProgress;
  std::string    detail;
};

struct CompletedUpload {
  std::string archive_id;
  std::string checksum;  // tree hash the vault computed
};

// Cold-storage vault. Implementations report failures with
// TransientNetworkError, RemoteProtocolError, ChecksumMismatchError or
// IncompleteUploadError; any other exception is treated as fatal.
class ArchiveRemote {
public:
  virtual ~ArchiveRemote() = default;

  virtual CompletedUpload uploadArchive(const std::string& description,
                                        std::string_view bytes,
                                        const std::string& treeHash) = 0;

  virtual std::string initiateUpload(const std::string& description, uint64_t partSize) = 0;

  // Returns the checksum the vault computed for the part.
  virtual std::string uploadPart(const std::string& handle, uint64_t offset,
                                 std::string_view bytes, const std::string& checksum) = 0;

  virtual CompletedUpload completeUpload(const std::string& handle, uint64_t totalSize,
                                         const std::string& treeHash) = 0;

  virtual void abortUpload(const std::string& handle) = 0;

  // InProgress while the handle is open.
  virtual RemoteJobStatus describeUpload(const std::string& handle) = 0;

  virtual std::string initiateRetrieval(const std::string& remoteArchiveId,
                                        const ByteRange& range,
                                        const std::string& description) = 0;

  virtual RemoteJobStatus describeJob(const std::string& remoteJobId) = 0;
};

} // namespace alib
