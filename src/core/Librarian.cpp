#include "Librarian.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <set>
#include <stdexcept>

#include "core/Errors.hpp"
#include "core/ledger/InitDb.hpp"
#include "core/transfer/TreeHasher.hpp"

namespace fs = std::filesystem;

namespace alib {

static std::string pending_root(const std::string& root) {
  return (fs::path(root) / "blobs" / "pending").string();
}

static std::string confirmed_root(const std::string& root) {
  return (fs::path(root) / "blobs" / "confirmed").string();
}

// Brings an existing ledger up to the current format and returns its path.
static std::string open_ledger(const std::string& root, const std::string& schemaPath) {
  if (!Librarian::isInitialized(root))
    throw NotFoundError("no archive repository at " + root);
  initDatabase(Librarian::ledgerPath(root), schemaPath);
  return Librarian::ledgerPath(root);
}

std::string Librarian::ledgerPath(const std::string& root) {
  return (fs::path(root) / "ledger.db").string();
}

bool Librarian::isInitialized(const std::string& root) {
  return fs::exists(ledgerPath(root));
}

void Librarian::initRepository(const std::string& root, const std::string& schemaPath) {
  if (isInitialized(root))
    throw ValidationError("an archive repository already exists at " + root);
  fs::create_directories(pending_root(root));
  fs::create_directories(confirmed_root(root));
  initDatabase(ledgerPath(root), schemaPath);
  spdlog::info("archive repository initialized at {}", root);
}

Librarian::Librarian(const std::string& root,
                     const std::string& schemaPath,
                     const EngineConfig& config,
                     ArchiveRemote& remote,
                     VersionControl* vcs)
  : root_(root),
    config_(config),
    remote_(remote),
    vcs_(vcs),
    db_(open_ledger(root, schemaPath)),
    ledger_(db_, config_),
    tracker_(db_),
    blobs_(pending_root(root), confirmed_root(root)),
    limiter_(config_.global_concurrency),
    engine_(config_, remote_, tracker_, blobs_, limiter_) {
  spdlog::info("librarian ready: {} archive(s) in {}, vault {}", ledger_.size(), root_, config_.vault_name);
}

// -------- archives --------

ArchiveRecord Librarian::create(const CreateArchiveRequest& req, uint64_t size,
                                const std::string& checksum, const StageFn& stage) {
  RecordDraft draft;
  draft.source_path      = req.source_path;
  draft.description      = req.description;
  draft.files            = req.files;
  draft.payload_checksum = checksum;
  draft.payload_size     = size;

  std::string staged;
  try {
    ArchiveRecord r = ledger_.createRecord(draft, [&](const ArchiveRecord& rec) {
      stage(rec);
      staged = rec.id;
    });
    commitLedger("create " + r.id);
    return r;
  } catch (...) {
    // The record never became visible; drop the payload it would have owned.
    if (!staged.empty() && !ledger_.findRecord(staged)) blobs_.remove(staged);
    throw;
  }
}

ArchiveRecord Librarian::createArchive(const CreateArchiveRequest& req) {
  if (req.payload_path.empty()) throw ValidationError("payload path is empty");
  std::error_code ec;
  const auto size = fs::file_size(req.payload_path, ec);
  if (ec) throw ValidationError("cannot read payload " + req.payload_path + ": " + ec.message());

  const std::string checksum = tree_hash_file(req.payload_path);
  return create(req, static_cast<uint64_t>(size), checksum, [&](const ArchiveRecord& r) {
    blobs_.stageFile(r.id, req.payload_path);
  });
}

ArchiveRecord Librarian::createArchiveFromBytes(const CreateArchiveRequest& req, std::string_view payload) {
  const std::string checksum = tree_hash_hex(payload);
  return create(req, payload.size(), checksum, [&](const ArchiveRecord& r) {
    blobs_.put(r.id, payload);
  });
}

ArchiveRecord Librarian::resolveReference(const std::string& reference) const {
  return ledger_.resolveReference(reference);
}

std::vector<ArchiveRecord> Librarian::listArchives(size_t limit) const {
  return ledger_.listRecords(limit);
}

// -------- uploads --------

UploadOutcome Librarian::runUpload(const ArchiveRecord& record,
                                   const std::function<UploadOutcome(const ArchiveRecord&)>& body) {
  if (record.upload_status == UploadStatus::None || record.upload_status == UploadStatus::Failed)
    ledger_.updateUploadStatus(record.id, UploadStatus::Pending);
  ledger_.updateUploadStatus(record.id, UploadStatus::InProgress);

  UploadOutcome out;
  try {
    out = body(record);
  } catch (const JobFailedError&) {
    ledger_.updateUploadStatus(record.id, UploadStatus::Failed);
    commitLedger("upload failed " + record.id);
    throw;
  }

  ledger_.updateUploadStatus(record.id, UploadStatus::Completed, out.remote_archive_id);
  blobs_.promote(record.id);
  commitLedger("upload " + record.id);
  return out;
}

UploadOutcome Librarian::startUpload(const std::string& reference) {
  const ArchiveRecord record = ledger_.resolveReference(reference);
  if (record.upload_status == UploadStatus::Completed)
    throw ValidationError("archive " + record.id + " is already in the vault");
  return runUpload(record, [this](const ArchiveRecord& r) { return engine_.upload(r); });
}

UploadOutcome Librarian::resumeUpload(const std::string& job_id) {
  const UploadJob job = tracker_.getUploadJob(job_id);
  const ArchiveRecord record = ledger_.getRecord(job.archive_id);
  return runUpload(record, [this, &job_id](const ArchiveRecord& r) { return engine_.resume(job_id, r); });
}

void Librarian::cancelUpload(const std::string& job_id) {
  engine_.cancel(job_id);
  const UploadJob job = tracker_.getUploadJob(job_id);
  if (job.state == UploadJobState::Failed) {
    ledger_.updateUploadStatus(job.archive_id, UploadStatus::Failed);
    commitLedger("cancel " + job.archive_id);
  }
}

// -------- retrievals --------

RetrievalJob Librarian::startRetrieval(const std::string& reference, const std::optional<ByteRange>& range) {
  const ArchiveRecord record = ledger_.resolveReference(reference);
  if (auto open = tracker_.openRetrievalJobFor(record.id)) {
    throw ValidationError("archive " + record.id + " already has retrieval job " + open->id +
                          " (" + to_string(open->state) + ")");
  }
  RetrievalJob job = engine_.startRetrieval(record, range);
  mirrorRetrieval(record.id);
  commitLedger("retrieve " + record.id);
  return job;
}

// The record carries one retrieval status: that of the archive's latest
// retrieval job. A status left by an earlier job is restarted first.
bool Librarian::mirrorRetrieval(const std::string& archive_id) {
  const auto job = tracker_.latestRetrievalJobFor(archive_id);
  if (!job) return false;
  const ArchiveRecord record = ledger_.getRecord(archive_id);
  bool changed = false;
  if (record.retrieval_status && is_terminal(*record.retrieval_status) &&
      *record.retrieval_status != job->state) {
    changed |= ledger_.updateRetrievalStatus(archive_id, RetrievalStatus::Pending);
  }
  changed |= ledger_.updateRetrievalStatus(archive_id, job->state);
  return changed;
}

bool Librarian::mirrorUpload(const UploadJob& job) {
  if (job.state == UploadJobState::Completed) {
    if (!job.remote_archive_id)
      spdlog::warn("upload job {} completed remotely without a known archive id", job.id);
    return ledger_.updateUploadStatus(job.archive_id, UploadStatus::Completed, job.remote_archive_id);
  }
  if (job.state == UploadJobState::Failed)
    return ledger_.updateUploadStatus(job.archive_id, UploadStatus::Failed);
  return false;
}

std::vector<ReconcileResult> Librarian::checkJobs() {
  std::vector<ReconcileResult> results = tracker_.reconcileAll(remote_);
  bool changed = false;

  std::set<std::string> retrieved;
  for (const auto& r : results) {
    if (r.kind == JobKind::Retrieval) {
      if (const auto job = tracker_.findRetrievalJob(r.job_id)) retrieved.insert(job->archive_id);
      continue;
    }
    if (!r.advanced) continue;
    const auto job = tracker_.findUploadJob(r.job_id);
    if (!job) continue;
    try {
      changed |= mirrorUpload(*job);
    } catch (const ValidationError& e) {
      spdlog::warn("upload job {}: ledger not updated: {}", job->id, e.what());
    }
  }
  for (const auto& archive_id : retrieved) {
    try {
      changed |= mirrorRetrieval(archive_id);
    } catch (const ValidationError& e) {
      spdlog::warn("archive {}: retrieval status not updated: {}", archive_id, e.what());
    }
  }

  size_t anomalies = 0;
  for (const auto& r : results) if (r.anomaly) ++anomalies;
  spdlog::info("checked {} job(s): {} anomaly(ies)", results.size(), anomalies);

  if (changed) commitLedger("check jobs");
  return results;
}

size_t Librarian::cleanupDangling() {
  return engine_.cleanupDangling();
}

void Librarian::commitLedger(const std::string& what) {
  if (!vcs_) return;
  try {
    const std::string id = vcs_->commit(ledger_.snapshotJson());
    vcs_->push();
    spdlog::debug("ledger committed as {} ({})", id, what);
  } catch (const std::exception& e) {
    spdlog::error("version control failed after {}: {}", what, e.what());
  }
}

} // namespace alib
