#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/jobs/JobTracker.hpp"
#include "core/ledger/ArchiveRecord.hpp"
#include "core/ledger/Database.hpp"
#include "core/ledger/Ledger.hpp"
#include "core/remote/ArchiveRemote.hpp"
#include "core/storage/BlobStore.hpp"
#include "core/transfer/TransferEngine.hpp"
#include "core/transfer/TransferLimiter.hpp"
#include "core/vcs/VersionControl.hpp"

namespace alib {

struct CreateArchiveRequest {
  std::string source_path;
  std::string description;
  std::vector<FileEntry> files;
  std::string payload_path;   // packed payload to stage; unused by createArchiveFromBytes
};

// Front door for every front end. Owns one repository:
//   <root>/ledger.db
//   <root>/blobs/pending/<id>
//   <root>/blobs/confirmed/<id>
// Results come back as values; failures as the typed errors in Errors.hpp.
class Librarian {
public:
  static std::string ledgerPath(const std::string& root);
  static bool isInitialized(const std::string& root);
  // Throws ValidationError if a repository already exists at root.
  static void initRepository(const std::string& root, const std::string& schemaPath);

  Librarian(const std::string& root,
            const std::string& schemaPath,
            const EngineConfig& config,
            ArchiveRemote& remote,
            VersionControl* vcs = nullptr);

  ArchiveRecord createArchive(const CreateArchiveRequest& req);
  ArchiveRecord createArchiveFromBytes(const CreateArchiveRequest& req, std::string_view payload);

  ArchiveRecord resolveReference(const std::string& reference) const;
  std::vector<ArchiveRecord> listArchives(size_t limit = 0) const;

  UploadOutcome startUpload(const std::string& reference);
  UploadOutcome resumeUpload(const std::string& job_id);
  void cancelUpload(const std::string& job_id);

  // Refused while the archive has an open retrieval job.
  RetrievalJob startRetrieval(const std::string& reference,
                              const std::optional<ByteRange>& range = std::nullopt);

  // Reconciles every open job with the vault and mirrors the outcome onto
  // the archive records.
  std::vector<ReconcileResult> checkJobs();
  size_t cleanupDangling();

  const Ledger& ledger() const { return ledger_; }
  JobTracker& jobs() { return tracker_; }
  const BlobStore& blobs() const { return blobs_; }

private:
  using StageFn = std::function<void(const ArchiveRecord&)>;

  ArchiveRecord create(const CreateArchiveRequest& req, uint64_t size,
                       const std::string& checksum, const StageFn& stage);
  UploadOutcome runUpload(const ArchiveRecord& record,
                          const std::function<UploadOutcome(const ArchiveRecord&)>& body);
  bool mirrorUpload(const UploadJob& job);
  bool mirrorRetrieval(const std::string& archive_id);
  void commitLedger(const std::string& what);

  std::string root_;
  EngineConfig config_;
  ArchiveRemote& remote_;
  VersionControl* vcs_;

  Database db_;
  Ledger ledger_;
  JobTracker tracker_;
  BlobStore blobs_;
  TransferLimiter limiter_;
  TransferEngine engine_;
};

} // namespace alib
