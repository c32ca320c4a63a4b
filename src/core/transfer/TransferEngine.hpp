#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "core/jobs/JobTracker.hpp"
#include "core/ledger/ArchiveRecord.hpp"
#include "core/remote/ArchiveRemote.hpp"
#include "core/storage/BlobStore.hpp"
#include "core/transfer/TransferLimiter.hpp"

namespace alib {

struct UploadOutcome {
  std::string      job_id;
  TransferStrategy strategy = TransferStrategy::SinglePart;
  UploadJobState   state = UploadJobState::Pending;
  std::string      remote_archive_id;
  std::string      checksum;
  int              attempts = 0;
  size_t           parts_sent = 0;   // parts uploaded by this call
};

// Drives uploads and retrieval requests against the vault.
//
// Transient remote errors are retried with exponential backoff inside the
// engine. Anything that ends a job throws JobFailedError after the job has
// been marked FAILED. Local I/O errors propagate as-is and leave the job
// resumable.
class TransferEngine {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  TransferEngine(const EngineConfig& config,
                 ArchiveRemote& remote,
                 JobTracker& tracker,
                 BlobStore& blobs,
                 TransferLimiter& limiter,
                 Sleeper sleeper = {});

  // Inclusive: size == threshold is still single part.
  TransferStrategy decide(uint64_t size) const;

  // Starts a new upload job for the record, or resumes its open one.
  UploadOutcome upload(const ArchiveRecord& record);
  // Continues a job left open by an earlier run; only unconfirmed parts go out.
  UploadOutcome resume(const std::string& job_id, const ArchiveRecord& record);

  // Cooperative: running parts finish, no new part starts, then the upload
  // is aborted. Jobs not running here are aborted immediately.
  void cancel(const std::string& job_id);

  RetrievalJob startRetrieval(const ArchiveRecord& record,
                              const std::optional<ByteRange>& range = std::nullopt);

  // Retries the abort of every recorded dangling handle; returns how many
  // were released.
  size_t cleanupDangling();

  std::chrono::milliseconds backoffFor(int attempt) const;

private:
  template <typename Fn>
  auto withRetry(const char* what, const std::string& job_id, int& attempts, Fn&& fn) -> decltype(fn());

  UploadOutcome run(UploadJob job, const ArchiveRecord& record);
  UploadOutcome runSingle(UploadJob job, const ArchiveRecord& record);
  UploadOutcome runMulti(UploadJob job, const ArchiveRecord& record);
  // Marks the job FAILED and returns the error for the caller to throw.
  JobFailedError failJob(const UploadJob& job, int attempts, const std::string& error, ErrorKind cause);
  void abortHandle(const std::string& job_id, const std::string& handle);
  bool cancelRequested(const std::string& job_id);
  std::string localChecksum(const ArchiveRecord& record, uint64_t size);

  EngineConfig config_;
  ArchiveRemote& remote_;
  JobTracker& tracker_;
  BlobStore& blobs_;
  TransferLimiter& limiter_;
  Sleeper sleeper_;

  std::mutex mu_;
  std::set<std::string> active_;
  std::set<std::string> cancelled_;
};

} // namespace alib
