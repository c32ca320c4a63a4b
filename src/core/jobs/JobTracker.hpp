#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/jobs/Jobs.hpp"
#include "core/ledger/Database.hpp"
#include "core/transfer/ChunkPlan.hpp"

namespace alib {

class ArchiveRemote;

// Persistent record of upload and retrieval jobs.
//
// Every state change is appended to job_transitions; nothing there is ever
// rewritten. States only move forward: asking for the state a job is already
// in is a no-op, asking for an earlier one (or leaving a terminal state) is a
// ValidationError.
class JobTracker {
public:
  explicit JobTracker(Database& db);

  // -------- uploads --------
  UploadJob createUploadJob(const std::string& archive_id, TransferStrategy strategy,
                            uint64_t total_size, const ChunkPlan* plan = nullptr);
  std::optional<UploadJob> findUploadJob(const std::string& job_id) const;
  UploadJob getUploadJob(const std::string& job_id) const;
  // The non-terminal upload job for an archive, if one exists.
  std::optional<UploadJob> openUploadJobFor(const std::string& archive_id) const;
  std::vector<UploadJob> uploadJobs(bool open_only = false) const;

  bool advanceUpload(const std::string& job_id, UploadJobState state,
                     const std::string& source = "engine");
  void setHandle(const std::string& job_id, const std::string& handle);
  void recordAttempt(const std::string& job_id, int attempts, const std::string& last_error);
  void setRemoteArchiveId(const std::string& job_id, const std::string& remote_archive_id);
  // Persisted before completeUpload goes out, so a lost answer is detectable.
  void markCompletionRequested(const std::string& job_id);

  void confirmPart(const std::string& job_id, uint32_t index, const std::string& checksum);
  std::vector<PartUpload> parts(const std::string& job_id) const;
  std::vector<PartUpload> unconfirmedParts(const std::string& job_id) const;

  // -------- retrievals --------
  RetrievalJob createRetrievalJob(const std::string& archive_id, const std::string& remote_job_id,
                                  const ByteRange& range);
  std::optional<RetrievalJob> findRetrievalJob(const std::string& job_id) const;
  std::vector<RetrievalJob> retrievalJobs(bool open_only = false) const;
  std::optional<RetrievalJob> openRetrievalJobFor(const std::string& archive_id) const;
  // The archive's most recently requested retrieval, whatever its state.
  std::optional<RetrievalJob> latestRetrievalJobFor(const std::string& archive_id) const;
  bool advanceRetrieval(const std::string& job_id, RetrievalStatus state,
                        const std::string& source = "engine");

  // -------- reconciliation --------
  // Applies the remote's view when it moves the job forward. A report that
  // contradicts a terminal state is stored and raised as ReconciliationAnomaly.
  ReconcileResult reconcile(const std::string& job_id, ArchiveRemote& remote);
  // Every non-terminal job; anomalies are collected, not thrown.
  std::vector<ReconcileResult> reconcileAll(ArchiveRemote& remote);

  std::vector<Transition> transitions(const std::string& job_id) const;
  AnomalyRecord recordAnomaly(const std::string& job_id, const std::string& recorded,
                              const std::string& remote, const std::string& detail);
  std::vector<AnomalyRecord> anomalies() const;

  // -------- abandoned multi-part handles --------
  void recordDanglingUpload(const std::string& job_id, const std::string& handle,
                            const std::string& last_error);
  std::vector<DanglingUpload> danglingUploads() const;
  void clearDanglingUpload(const std::string& handle);

private:
  std::vector<PartUpload> loadParts(const std::string& job_id, bool unconfirmed_only) const;
  void insertTransition(const std::string& job_id, JobKind kind,
                        const std::optional<std::string>& from, const std::string& to,
                        int64_t at, const std::string& source);
  std::optional<RetrievalJob> retrievalJobFor(const std::string& archive_id, bool open_only) const;
  ReconcileResult reconcileUpload(const UploadJob& job, ArchiveRemote& remote);
  ReconcileResult reconcileRetrieval(const RetrievalJob& job, ArchiveRemote& remote);

  Database& db_;
};

} // namespace alib
