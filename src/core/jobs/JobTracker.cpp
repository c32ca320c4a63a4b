#include "JobTracker.hpp"

#include <spdlog/spdlog.h>
#include <mutex>
#include <utility>

#include "core/Errors.hpp"
#include "core/crypto/Sha256.hpp"
#include "core/remote/ArchiveRemote.hpp"

namespace alib {

// -------- helpers --------

static std::string new_job_id(const char* prefix) {
  const std::string salt = random_bytes(6);
  return prefix + to_hex(reinterpret_cast<const uint8_t*>(salt.data()), salt.size());
}

static int rank(UploadJobState s) {
  switch (s) {
    case UploadJobState::Pending:    return 0;
    case UploadJobState::InProgress: return 1;
    case UploadJobState::Cancelling: return 2;
    case UploadJobState::Completed:
    case UploadJobState::Failed:     return 3;
  }
  return 0;
}

static int rank(RetrievalStatus s) {
  switch (s) {
    case RetrievalStatus::Pending:    return 0;
    case RetrievalStatus::InProgress: return 1;
    case RetrievalStatus::Ready:      return 2;
    case RetrievalStatus::Expired:
    case RetrievalStatus::Failed:     return 3;
  }
  return 0;
}

template <typename State>
static void check_forward(const std::string& job_id, State from, State to) {
  if (is_terminal(from) || rank(to) < rank(from)) {
    throw ValidationError("job " + job_id + ": illegal transition " +
                          to_string(from) + " -> " + to_string(to));
  }
}

static const char* kUploadColumns = R"SQL(
  SELECT id, archive_id, strategy, state, total_size, part_size, handle, attempts,
         last_error, remote_archive_id, created_at, updated_at, completion_requested_at
  FROM upload_jobs
)SQL";

static UploadJob read_upload_job(const Statement& st) {
  UploadJob j;
  j.id         = st.text(0);
  j.archive_id = st.text(1);
  j.strategy   = strategy_from(st.text(2));
  j.state      = upload_job_state_from(st.text(3));
  j.total_size = static_cast<uint64_t>(st.int64(4));
  j.part_size  = static_cast<uint64_t>(st.int64(5));
  if (!st.isNull(6)) j.handle = st.text(6);
  j.attempts   = static_cast<int>(st.int64(7));
  j.last_error = st.text(8);
  if (!st.isNull(9)) j.remote_archive_id = st.text(9);
  j.created_at = st.int64(10);
  j.updated_at = st.int64(11);
  j.completion_requested = !st.isNull(12);
  return j;
}

static const char* kRetrievalColumns = R"SQL(
  SELECT id, archive_id, remote_job_id, state, range_start, range_end, requested_at, updated_at
  FROM retrieval_jobs
)SQL";

static RetrievalJob read_retrieval_job(const Statement& st) {
  RetrievalJob j;
  j.id            = st.text(0);
  j.archive_id    = st.text(1);
  j.remote_job_id = st.text(2);
  j.state         = retrieval_status_from(st.text(3));
  j.range.first   = static_cast<uint64_t>(st.int64(4));
  j.range.last    = static_cast<uint64_t>(st.int64(5));
  j.requested_at  = st.int64(6);
  j.updated_at    = st.int64(7);
  return j;
}

// -------- JobTracker --------

JobTracker::JobTracker(Database& db) : db_(db) {}

UploadJob JobTracker::createUploadJob(const std::string& archive_id, TransferStrategy strategy,
                                      uint64_t total_size, const ChunkPlan* plan) {
  if (strategy == TransferStrategy::MultiPart && !plan)
    throw ValidationError("multi-part upload job needs a chunk plan");

  UploadJob job;
  job.id         = new_job_id("up-");
  job.archive_id = archive_id;
  job.strategy   = strategy;
  job.total_size = total_size;
  job.created_at = unix_now();
  job.updated_at = job.created_at;
  if (plan) {
    job.part_size = plan->part_size;
    for (const auto& span : plan->parts) job.parts.push_back({span.index, span.offset, span.length, "", false});
  }

  WriteTransaction tx(db_);
  Statement ins(db_, R"SQL(
    INSERT INTO upload_jobs (id, archive_id, strategy, state, total_size, part_size, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL");
  ins.bindText(1, job.id)
     .bindText(2, job.archive_id)
     .bindText(3, to_string(job.strategy))
     .bindText(4, to_string(job.state))
     .bindInt64(5, static_cast<int64_t>(job.total_size))
     .bindInt64(6, static_cast<int64_t>(job.part_size))
     .bindInt64(7, job.created_at)
     .bindInt64(8, job.updated_at);
  ins.run();

  Statement part(db_, "INSERT INTO upload_parts (job_id, idx, part_offset, length) VALUES (?,?,?,?)");
  for (const auto& p : job.parts) {
    part.bindText(1, job.id)
        .bindInt64(2, p.index)
        .bindInt64(3, static_cast<int64_t>(p.offset))
        .bindInt64(4, static_cast<int64_t>(p.length));
    part.run();
    part.reset();
  }

  insertTransition(job.id, JobKind::Upload, std::nullopt, to_string(job.state), job.created_at, "engine");
  tx.commit();

  spdlog::debug("upload job {} for archive {} created ({}, {} part(s))",
                job.id, archive_id, to_string(strategy), job.parts.size());
  return job;
}

std::optional<UploadJob> JobTracker::findUploadJob(const std::string& job_id) const {
  std::optional<UploadJob> job;
  {
    std::lock_guard<std::mutex> lk(db_.writeMutex());
    Statement st(db_, (std::string(kUploadColumns) + " WHERE id = ?").c_str());
    st.bindText(1, job_id);
    if (st.step()) job = read_upload_job(st);
  }
  if (job) job->parts = parts(job_id);
  return job;
}

UploadJob JobTracker::getUploadJob(const std::string& job_id) const {
  auto job = findUploadJob(job_id);
  if (!job) throw NotFoundError("no upload job " + job_id);
  return *job;
}

std::optional<UploadJob> JobTracker::openUploadJobFor(const std::string& archive_id) const {
  std::optional<std::string> id;
  {
    std::lock_guard<std::mutex> lk(db_.writeMutex());
    Statement st(db_, R"SQL(
      SELECT id FROM upload_jobs
      WHERE archive_id = ? AND state NOT IN ('COMPLETED', 'FAILED')
      ORDER BY created_at DESC LIMIT 1
    )SQL");
    st.bindText(1, archive_id);
    if (st.step()) id = st.text(0);
  }
  if (!id) return std::nullopt;
  return findUploadJob(*id);
}

std::vector<UploadJob> JobTracker::uploadJobs(bool open_only) const {
  std::vector<UploadJob> out;
  {
    std::lock_guard<std::mutex> lk(db_.writeMutex());
    std::string sql = kUploadColumns;
    if (open_only) sql += " WHERE state NOT IN ('COMPLETED', 'FAILED')";
    sql += " ORDER BY created_at, id";
    Statement st(db_, sql.c_str());
    while (st.step()) out.push_back(read_upload_job(st));
  }
  for (auto& j : out) j.parts = parts(j.id);
  return out;
}

bool JobTracker::advanceUpload(const std::string& job_id, UploadJobState state,
                               const std::string& source) {
  WriteTransaction tx(db_);
  Statement sel(db_, "SELECT state FROM upload_jobs WHERE id = ?");
  sel.bindText(1, job_id);
  if (!sel.step()) throw NotFoundError("no upload job " + job_id);
  const UploadJobState cur = upload_job_state_from(sel.text(0));
  sel.reset();

  if (cur == state) return false;
  check_forward(job_id, cur, state);

  const int64_t now = unix_now();
  Statement up(db_, "UPDATE upload_jobs SET state = ?, updated_at = ? WHERE id = ?");
  up.bindText(1, to_string(state)).bindInt64(2, now).bindText(3, job_id);
  up.run();
  insertTransition(job_id, JobKind::Upload, std::string(to_string(cur)), to_string(state), now, source);
  tx.commit();

  spdlog::debug("upload job {}: {} -> {} ({})", job_id, to_string(cur), to_string(state), source);
  return true;
}

void JobTracker::setHandle(const std::string& job_id, const std::string& handle) {
  WriteTransaction tx(db_);
  Statement up(db_, "UPDATE upload_jobs SET handle = ?, updated_at = ? WHERE id = ?");
  up.bindText(1, handle).bindInt64(2, unix_now()).bindText(3, job_id);
  up.run();
  tx.commit();
}

void JobTracker::recordAttempt(const std::string& job_id, int attempts, const std::string& last_error) {
  WriteTransaction tx(db_);
  Statement up(db_, "UPDATE upload_jobs SET attempts = ?, last_error = ?, updated_at = ? WHERE id = ?");
  up.bindInt64(1, attempts).bindText(2, last_error).bindInt64(3, unix_now()).bindText(4, job_id);
  up.run();
  tx.commit();
}

void JobTracker::setRemoteArchiveId(const std::string& job_id, const std::string& remote_archive_id) {
  WriteTransaction tx(db_);
  Statement up(db_, "UPDATE upload_jobs SET remote_archive_id = ?, updated_at = ? WHERE id = ?");
  up.bindText(1, remote_archive_id).bindInt64(2, unix_now()).bindText(3, job_id);
  up.run();
  tx.commit();
}

void JobTracker::markCompletionRequested(const std::string& job_id) {
  WriteTransaction tx(db_);
  Statement up(db_, R"SQL(
    UPDATE upload_jobs SET completion_requested_at = COALESCE(completion_requested_at, ?), updated_at = ?
    WHERE id = ?
  )SQL");
  const int64_t now = unix_now();
  up.bindInt64(1, now).bindInt64(2, now).bindText(3, job_id);
  up.run();
  tx.commit();
}

void JobTracker::confirmPart(const std::string& job_id, uint32_t index, const std::string& checksum) {
  WriteTransaction tx(db_);
  Statement up(db_, R"SQL(
    UPDATE upload_parts SET confirmed = 1, checksum = ?, confirmed_at = ?
    WHERE job_id = ? AND idx = ? AND confirmed = 0
  )SQL");
  up.bindText(1, checksum).bindInt64(2, unix_now()).bindText(3, job_id).bindInt64(4, index);
  up.run();
  tx.commit();
}

std::vector<PartUpload> JobTracker::loadParts(const std::string& job_id, bool unconfirmed_only) const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  std::string sql = "SELECT idx, part_offset, length, checksum, confirmed FROM upload_parts WHERE job_id = ?";
  if (unconfirmed_only) sql += " AND confirmed = 0";
  sql += " ORDER BY idx";
  Statement st(db_, sql.c_str());
  st.bindText(1, job_id);

  std::vector<PartUpload> out;
  while (st.step()) {
    out.push_back({static_cast<uint32_t>(st.int64(0)),
                   static_cast<uint64_t>(st.int64(1)),
                   static_cast<uint64_t>(st.int64(2)),
                   st.text(3),
                   st.int64(4) != 0});
  }
  return out;
}

std::vector<PartUpload> JobTracker::parts(const std::string& job_id) const {
  return loadParts(job_id, false);
}

std::vector<PartUpload> JobTracker::unconfirmedParts(const std::string& job_id) const {
  return loadParts(job_id, true);
}

RetrievalJob JobTracker::createRetrievalJob(const std::string& archive_id,
                                            const std::string& remote_job_id,
                                            const ByteRange& range) {
  RetrievalJob job;
  job.id            = new_job_id("rt-");
  job.archive_id    = archive_id;
  job.remote_job_id = remote_job_id;
  job.range         = range;
  job.requested_at  = unix_now();
  job.updated_at    = job.requested_at;

  WriteTransaction tx(db_);
  Statement ins(db_, R"SQL(
    INSERT INTO retrieval_jobs
      (id, archive_id, remote_job_id, state, range_start, range_end, requested_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL");
  ins.bindText(1, job.id)
     .bindText(2, job.archive_id)
     .bindText(3, job.remote_job_id)
     .bindText(4, to_string(job.state))
     .bindInt64(5, static_cast<int64_t>(range.first))
     .bindInt64(6, static_cast<int64_t>(range.last))
     .bindInt64(7, job.requested_at)
     .bindInt64(8, job.updated_at);
  ins.run();
  insertTransition(job.id, JobKind::Retrieval, std::nullopt, to_string(job.state), job.requested_at, "engine");
  tx.commit();
  return job;
}

std::optional<RetrievalJob> JobTracker::findRetrievalJob(const std::string& job_id) const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  Statement st(db_, (std::string(kRetrievalColumns) + " WHERE id = ?").c_str());
  st.bindText(1, job_id);
  if (!st.step()) return std::nullopt;
  return read_retrieval_job(st);
}

std::vector<RetrievalJob> JobTracker::retrievalJobs(bool open_only) const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  std::string sql = kRetrievalColumns;
  if (open_only) sql += " WHERE state NOT IN ('EXPIRED', 'FAILED')";
  sql += " ORDER BY requested_at, id";
  Statement st(db_, sql.c_str());
  std::vector<RetrievalJob> out;
  while (st.step()) out.push_back(read_retrieval_job(st));
  return out;
}

std::optional<RetrievalJob> JobTracker::retrievalJobFor(const std::string& archive_id,
                                                        bool open_only) const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  std::string sql = std::string(kRetrievalColumns) + " WHERE archive_id = ?";
  if (open_only) sql += " AND state NOT IN ('EXPIRED', 'FAILED')";
  // rowid orders requests made within the same second.
  sql += " ORDER BY requested_at DESC, rowid DESC LIMIT 1";
  Statement st(db_, sql.c_str());
  st.bindText(1, archive_id);
  if (!st.step()) return std::nullopt;
  return read_retrieval_job(st);
}

std::optional<RetrievalJob> JobTracker::openRetrievalJobFor(const std::string& archive_id) const {
  return retrievalJobFor(archive_id, true);
}

std::optional<RetrievalJob> JobTracker::latestRetrievalJobFor(const std::string& archive_id) const {
  return retrievalJobFor(archive_id, false);
}

bool JobTracker::advanceRetrieval(const std::string& job_id, RetrievalStatus state,
                                  const std::string& source) {
  WriteTransaction tx(db_);
  Statement sel(db_, "SELECT state FROM retrieval_jobs WHERE id = ?");
  sel.bindText(1, job_id);
  if (!sel.step()) throw NotFoundError("no retrieval job " + job_id);
  const RetrievalStatus cur = retrieval_status_from(sel.text(0));
  sel.reset();

  if (cur == state) return false;
  check_forward(job_id, cur, state);

  const int64_t now = unix_now();
  Statement up(db_, "UPDATE retrieval_jobs SET state = ?, updated_at = ? WHERE id = ?");
  up.bindText(1, to_string(state)).bindInt64(2, now).bindText(3, job_id);
  up.run();
  insertTransition(job_id, JobKind::Retrieval, std::string(to_string(cur)), to_string(state), now, source);
  tx.commit();

  spdlog::debug("retrieval job {}: {} -> {} ({})", job_id, to_string(cur), to_string(state), source);
  return true;
}

// -------- reconciliation --------

ReconcileResult JobTracker::reconcile(const std::string& job_id, ArchiveRemote& remote) {
  ReconcileResult res;
  if (auto up = findUploadJob(job_id)) {
    res = reconcileUpload(*up, remote);
  } else if (auto rt = findRetrievalJob(job_id)) {
    res = reconcileRetrieval(*rt, remote);
  } else {
    throw NotFoundError("no job " + job_id);
  }
  if (res.anomaly) throw ReconciliationAnomaly(job_id, res.anomaly->detail);
  return res;
}

std::vector<ReconcileResult> JobTracker::reconcileAll(ArchiveRemote& remote) {
  std::vector<ReconcileResult> out;
  auto guarded = [&](const std::string& job_id, auto&& fn) {
    try {
      out.push_back(fn());
    } catch (const TransientNetworkError& e) {
      spdlog::warn("reconcile {} skipped: {}", job_id, e.what());
    }
  };
  for (const auto& job : uploadJobs(true)) guarded(job.id, [&] { return reconcileUpload(job, remote); });
  for (const auto& job : retrievalJobs(true)) guarded(job.id, [&] { return reconcileRetrieval(job, remote); });
  return out;
}

ReconcileResult JobTracker::reconcileUpload(const UploadJob& job, ArchiveRemote& remote) {
  ReconcileResult res;
  res.job_id = job.id;
  res.kind = JobKind::Upload;
  res.before = to_string(job.state);
  res.after = res.before;

  // Only an open multi-part handle is visible on the remote side.
  if (job.strategy != TransferStrategy::MultiPart || !job.handle) return res;

  const RemoteJobStatus status = remote.describeUpload(*job.handle);
  UploadJobState target = UploadJobState::Failed;
  switch (status.state) {
    case RemoteJobState::InProgress: target = UploadJobState::InProgress; break;
    case RemoteJobState::Succeeded:  target = UploadJobState::Completed;  break;
    case RemoteJobState::Failed:
    case RemoteJobState::Expired:
    case RemoteJobState::NotFound:   target = UploadJobState::Failed;     break;
  }

  // A handle that closed after completion was requested may hold a stored
  // archive; failing the job here would contradict the vault.
  if (!is_terminal(job.state) && job.completion_requested &&
      status.state != RemoteJobState::InProgress) {
    res.anomaly = recordAnomaly(job.id, res.before, to_string(status.state),
                                "upload handle " + *job.handle + " reported " +
                                to_string(status.state) + " after completion was requested");
    return res;
  }

  if (is_terminal(job.state)) {
    // A completed upload's handle disappears remotely; that is expected.
    const bool consistent = target == job.state ||
        (job.state == UploadJobState::Completed && status.state == RemoteJobState::NotFound);
    if (!consistent) {
      res.anomaly = recordAnomaly(job.id, res.before, to_string(status.state),
                                  "upload handle " + *job.handle + " reported " +
                                  to_string(status.state) + " after " + res.before);
    }
    return res;
  }

  if (rank(target) > rank(job.state)) {
    res.advanced = advanceUpload(job.id, target, "reconcile");
    res.after = to_string(target);
  }
  return res;
}

ReconcileResult JobTracker::reconcileRetrieval(const RetrievalJob& job, ArchiveRemote& remote) {
  ReconcileResult res;
  res.job_id = job.id;
  res.kind = JobKind::Retrieval;
  res.before = to_string(job.state);
  res.after = res.before;

  const RemoteJobStatus status = remote.describeJob(job.remote_job_id);
  std::optional<RetrievalStatus> target;
  switch (status.state) {
    case RemoteJobState::InProgress: target = RetrievalStatus::InProgress; break;
    case RemoteJobState::Succeeded:  target = RetrievalStatus::Ready;      break;
    case RemoteJobState::Failed:     target = RetrievalStatus::Failed;     break;
    case RemoteJobState::Expired:    target = RetrievalStatus::Expired;    break;
    case RemoteJobState::NotFound:
      // The vault forgets finished jobs once their output window closes.
      if (job.state == RetrievalStatus::Ready || job.state == RetrievalStatus::Expired)
        target = RetrievalStatus::Expired;
      break;
  }

  if (!target || (is_terminal(job.state) && *target != job.state)) {
    res.anomaly = recordAnomaly(job.id, res.before, to_string(status.state),
                                "remote job " + job.remote_job_id + " reported " +
                                to_string(status.state) + " while recorded " + res.before);
    return res;
  }
  if (is_terminal(job.state)) return res;

  if (rank(*target) > rank(job.state)) {
    res.advanced = advanceRetrieval(job.id, *target, "reconcile");
    res.after = to_string(*target);
  } else if (rank(*target) < rank(job.state)) {
    spdlog::debug("retrieval job {}: remote still reports {}, keeping {}",
                  job.id, to_string(status.state), res.before);
  }
  return res;
}

void JobTracker::insertTransition(const std::string& job_id, JobKind kind,
                                  const std::optional<std::string>& from, const std::string& to,
                                  int64_t at, const std::string& source) {
  Statement st(db_, R"SQL(
    INSERT INTO job_transitions (job_id, job_kind, from_state, to_state, at, source)
    VALUES (?,?,?,?,?,?)
  )SQL");
  st.bindText(1, job_id).bindText(2, to_string(kind));
  if (from) st.bindText(3, *from); else st.bindNull(3);
  st.bindText(4, to).bindInt64(5, at).bindText(6, source);
  st.run();
}

AnomalyRecord JobTracker::recordAnomaly(const std::string& job_id, const std::string& recorded,
                                        const std::string& remote, const std::string& detail) {
  AnomalyRecord a;
  a.job_id = job_id;
  a.recorded_state = recorded;
  a.remote_state = remote;
  a.detail = detail;
  a.at = unix_now();

  WriteTransaction tx(db_);
  Statement st(db_, R"SQL(
    INSERT INTO reconciliation_anomalies (job_id, recorded_state, remote_state, detail, at)
    VALUES (?,?,?,?,?)
  )SQL");
  st.bindText(1, job_id).bindText(2, recorded).bindText(3, remote).bindText(4, detail).bindInt64(5, a.at);
  st.run();
  Statement seq(db_, "SELECT last_insert_rowid()");
  if (seq.step()) a.seq = seq.int64(0);
  seq.reset();
  tx.commit();

  spdlog::warn("reconciliation anomaly on job {}: {}", job_id, detail);
  return a;
}

std::vector<Transition> JobTracker::transitions(const std::string& job_id) const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  Statement st(db_, R"SQL(
    SELECT seq, job_id, job_kind, from_state, to_state, at, source
    FROM job_transitions WHERE job_id = ? ORDER BY seq
  )SQL");
  st.bindText(1, job_id);
  std::vector<Transition> out;
  while (st.step()) {
    Transition t;
    t.seq    = st.int64(0);
    t.job_id = st.text(1);
    t.kind   = st.text(2) == "RETRIEVAL" ? JobKind::Retrieval : JobKind::Upload;
    if (!st.isNull(3)) t.from = st.text(3);
    t.to     = st.text(4);
    t.at     = st.int64(5);
    t.source = st.text(6);
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<AnomalyRecord> JobTracker::anomalies() const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  Statement st(db_, R"SQL(
    SELECT seq, job_id, recorded_state, remote_state, detail, at
    FROM reconciliation_anomalies ORDER BY seq
  )SQL");
  std::vector<AnomalyRecord> out;
  while (st.step())
    out.push_back({st.int64(0), st.text(1), st.text(2), st.text(3), st.text(4), st.int64(5)});
  return out;
}

void JobTracker::recordDanglingUpload(const std::string& job_id, const std::string& handle,
                                      const std::string& last_error) {
  WriteTransaction tx(db_);
  Statement st(db_, R"SQL(
    INSERT INTO dangling_uploads (handle, job_id, last_error, at) VALUES (?,?,?,?)
    ON CONFLICT(handle) DO UPDATE SET last_error = excluded.last_error, at = excluded.at
  )SQL");
  st.bindText(1, handle).bindText(2, job_id).bindText(3, last_error).bindInt64(4, unix_now());
  st.run();
  tx.commit();
  spdlog::error("upload handle {} of job {} left open on the remote: {}", handle, job_id, last_error);
}

std::vector<DanglingUpload> JobTracker::danglingUploads() const {
  std::lock_guard<std::mutex> lk(db_.writeMutex());
  Statement st(db_, "SELECT handle, job_id, last_error, at FROM dangling_uploads ORDER BY at, handle");
  std::vector<DanglingUpload> out;
  while (st.step()) out.push_back({st.text(0), st.text(1), st.text(2), st.int64(3)});
  return out;
}

void JobTracker::clearDanglingUpload(const std::string& handle) {
  WriteTransaction tx(db_);
  Statement st(db_, "DELETE FROM dangling_uploads WHERE handle = ?");
  st.bindText(1, handle);
  st.run();
  tx.commit();
}

} // namespace alib
