#include "TransferEngine.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <thread>
#include <utility>
#include <vector>

#include "core/descriptor/DescriptorCodec.hpp"
#include "core/transfer/ChunkPlan.hpp"
#include "core/transfer/TreeHasher.hpp"

namespace alib {

TransferEngine::TransferEngine(const EngineConfig& config,
                               ArchiveRemote& remote,
                               JobTracker& tracker,
                               BlobStore& blobs,
                               TransferLimiter& limiter,
                               Sleeper sleeper)
  : config_(config),
    remote_(remote),
    tracker_(tracker),
    blobs_(blobs),
    limiter_(limiter),
    sleeper_(std::move(sleeper)) {
  validate(config_);
  if (!sleeper_) sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

TransferStrategy TransferEngine::decide(uint64_t size) const {
  return size <= config_.single_part_threshold ? TransferStrategy::SinglePart
                                               : TransferStrategy::MultiPart;
}

std::chrono::milliseconds TransferEngine::backoffFor(int attempt) const {
  auto d = config_.retry.backoff_base;
  for (int i = 1; i < attempt && d < config_.retry.backoff_max; ++i) d *= 2;
  return std::min(d, config_.retry.backoff_max);
}

template <typename Fn>
auto TransferEngine::withRetry(const char* what, const std::string& job_id, int& attempts, Fn&& fn)
    -> decltype(fn()) {
  for (;;) {
    ++attempts;
    try {
      return fn();
    } catch (const TransientNetworkError& e) {
      if (attempts >= config_.retry.max_attempts) {
        spdlog::error("{} for {} gave up after {} attempt(s): {}", what, job_id, attempts, e.what());
        throw;
      }
      const auto delay = backoffFor(attempts);
      spdlog::warn("{} for {} failed (attempt {}/{}), retrying in {} ms: {}",
                   what, job_id, attempts, config_.retry.max_attempts, delay.count(), e.what());
      sleeper_(delay);
    }
  }
}

// -------- uploads --------

UploadOutcome TransferEngine::upload(const ArchiveRecord& record) {
  if (auto open = tracker_.openUploadJobFor(record.id)) {
    spdlog::info("archive {} already has upload job {} ({}), resuming it",
                 record.id, open->id, to_string(open->state));
    return run(std::move(*open), record);
  }

  const uint64_t size = blobs_.size(record.id);
  const TransferStrategy strategy = decide(size);
  UploadJob job;
  if (strategy == TransferStrategy::MultiPart) {
    const ChunkPlan plan = plan_chunks(size, config_.part_limits);
    job = tracker_.createUploadJob(record.id, strategy, size, &plan);
  } else {
    job = tracker_.createUploadJob(record.id, strategy, size);
  }
  spdlog::info("upload job {} started for archive {} ({} bytes, {})",
               job.id, record.id, size, to_string(strategy));
  return run(std::move(job), record);
}

UploadOutcome TransferEngine::resume(const std::string& job_id, const ArchiveRecord& record) {
  UploadJob job = tracker_.getUploadJob(job_id);
  if (job.archive_id != record.id)
    throw ValidationError("job " + job_id + " belongs to archive " + job.archive_id + ", not " + record.id);
  return run(std::move(job), record);
}

UploadOutcome TransferEngine::run(UploadJob job, const ArchiveRecord& record) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_.insert(job.id).second) throw ValidationError("job " + job.id + " is already running");
  }
  struct Release {
    TransferEngine* engine;
    std::string id;
    ~Release() {
      std::lock_guard<std::mutex> lk(engine->mu_);
      engine->active_.erase(id);
      engine->cancelled_.erase(id);
    }
  } release{this, job.id};

  // Re-read now that the job is registered, so a concurrent cancel() is seen.
  job = tracker_.getUploadJob(job.id);
  if (is_terminal(job.state))
    throw ValidationError("job " + job.id + " is already " + to_string(job.state));

  if (job.state == UploadJobState::Cancelling) {
    if (job.handle) abortHandle(job.id, *job.handle);
    throw failJob(job, job.attempts, "cancelled", ErrorKind::Cancelled);
  }

  return job.strategy == TransferStrategy::MultiPart ? runMulti(std::move(job), record)
                                                     : runSingle(std::move(job), record);
}

UploadOutcome TransferEngine::runSingle(UploadJob job, const ArchiveRecord& record) {
  tracker_.advanceUpload(job.id, UploadJobState::InProgress);
  if (cancelRequested(job.id)) throw failJob(job, job.attempts, "cancelled", ErrorKind::Cancelled);

  const std::string bytes = blobs_.read(job.archive_id, 0, job.total_size);
  const std::string checksum = tree_hash_hex(bytes);
  if (!record.payload_checksum.empty() && checksum != record.payload_checksum) {
    throw failJob(job, job.attempts, ChecksumMismatchError(record.payload_checksum, checksum).what(),
                  ErrorKind::ChecksumMismatch);
  }

  const std::string description = encode_descriptor(record);
  int attempts = 0;
  CompletedUpload done;
  try {
    done = withRetry("upload", job.id, attempts, [&] {
      return remote_.uploadArchive(description, bytes, checksum);
    });
    if (done.checksum != checksum) throw ChecksumMismatchError(checksum, done.checksum);
  } catch (const ArchiveError& e) {
    throw failJob(job, job.attempts + attempts, e.what(), e.kind());
  }

  tracker_.recordAttempt(job.id, job.attempts + attempts, "");
  tracker_.setRemoteArchiveId(job.id, done.archive_id);
  tracker_.advanceUpload(job.id, UploadJobState::Completed);
  spdlog::info("upload job {} completed: archive {} stored as {}", job.id, record.id, done.archive_id);

  UploadOutcome out;
  out.job_id = job.id;
  out.strategy = TransferStrategy::SinglePart;
  out.state = UploadJobState::Completed;
  out.remote_archive_id = done.archive_id;
  out.checksum = checksum;
  out.attempts = job.attempts + attempts;
  out.parts_sent = 1;
  return out;
}

std::string TransferEngine::localChecksum(const ArchiveRecord& record, uint64_t size) {
  const uint64_t have = blobs_.size(record.id);
  if (have != size)
    throw ValidationError("payload of " + record.id + " is " + std::to_string(have) +
                          " bytes, job expects " + std::to_string(size));
  const std::string sum = tree_hash_file(blobs_.path(record.id));
  if (!record.payload_checksum.empty() && sum != record.payload_checksum)
    throw ChecksumMismatchError(record.payload_checksum, sum);
  return sum;
}

UploadOutcome TransferEngine::runMulti(UploadJob job, const ArchiveRecord& record) {
  if (job.state == UploadJobState::Pending) {
    tracker_.advanceUpload(job.id, UploadJobState::InProgress);
    job.state = UploadJobState::InProgress;
  }

  std::string total;
  try {
    total = localChecksum(record, job.total_size);
  } catch (const ArchiveError& e) {
    if (job.handle) abortHandle(job.id, *job.handle);
    throw failJob(job, job.attempts, e.what(), e.kind());
  }

  std::atomic<int> attempts{job.attempts};

  if (!job.handle) {
    if (cancelRequested(job.id)) throw failJob(job, attempts, "cancelled", ErrorKind::Cancelled);
    const std::string description = encode_descriptor(record);
    int a = 0;
    try {
      job.handle = withRetry("initiate upload", job.id, a, [&] {
        return remote_.initiateUpload(description, job.part_size);
      });
    } catch (const ArchiveError& e) {
      throw failJob(job, attempts + a, e.what(), e.kind());
    }
    attempts += a;
    tracker_.setHandle(job.id, *job.handle);
    spdlog::info("upload job {}: remote handle {}", job.id, *job.handle);
  }
  const std::string handle = *job.handle;

  // An earlier completion went unanswered. Only a handle that is still open
  // may be completed again.
  if (job.completion_requested) {
    int a = 0;
    RemoteJobStatus status;
    try {
      status = withRetry("describe upload", job.id, a, [&] { return remote_.describeUpload(handle); });
    } catch (const TransientNetworkError& e) {
      tracker_.recordAttempt(job.id, attempts + a, e.what());
      throw;
    }
    attempts += a;
    if (status.state != RemoteJobState::InProgress) {
      const std::string detail = "handle " + handle + " reports " + to_string(status.state) +
                                 " after an unacknowledged completion";
      tracker_.recordAttempt(job.id, attempts, detail);
      tracker_.recordAnomaly(job.id, to_string(job.state), to_string(status.state), detail);
      throw ReconciliationAnomaly(job.id, "upload job " + job.id + ": " + detail);
    }
    spdlog::info("upload job {}: handle {} still open, completing again", job.id, handle);
  }

  const std::vector<PartUpload> pending = tracker_.unconfirmedParts(job.id);
  spdlog::info("upload job {}: {} of {} part(s) to send", job.id, pending.size(), job.parts.size());

  std::atomic<size_t> next{0};
  std::atomic<size_t> sent{0};
  std::atomic<bool> stop{false};
  std::mutex fail_mu;
  std::optional<std::pair<std::string, ErrorKind>> failure;

  auto worker = [&]() {
    try {
      while (!stop) {
        // Checked between parts only; a part already on the wire finishes.
        if (cancelRequested(job.id)) { stop = true; break; }
        const size_t i = next.fetch_add(1);
        if (i >= pending.size()) break;
        const PartUpload& p = pending[i];

        TransferLimiter::Slot slot(limiter_);
        const std::string bytes = blobs_.read(job.archive_id, p.offset, p.length);
        const std::string sum = tree_hash_hex(bytes);
        int a = 0;
        try {
          const std::string confirmed = withRetry("part upload", job.id, a, [&] {
            return remote_.uploadPart(handle, p.offset, bytes, sum);
          });
          if (confirmed != sum) throw ChecksumMismatchError(sum, confirmed);
        } catch (const ArchiveError& e) {
          attempts += a;
          std::lock_guard<std::mutex> lk(fail_mu);
          if (!failure) failure.emplace("part " + std::to_string(p.index) + ": " + e.what(), e.kind());
          stop = true;
          break;
        }
        attempts += a;
        tracker_.confirmPart(job.id, p.index, sum);
        ++sent;
        spdlog::debug("upload job {}: part {} confirmed ({} bytes at {})", job.id, p.index, p.length, p.offset);
      }
    } catch (...) {
      stop = true;
      throw;
    }
  };

  const size_t n = std::min(static_cast<size_t>(config_.workers), pending.size());
  std::vector<std::future<void>> futures;
  futures.reserve(n);
  for (size_t w = 0; w < n; ++w) futures.push_back(std::async(std::launch::async, worker));

  std::exception_ptr local_error;
  for (auto& f : futures) {
    try {
      f.get();
    } catch (...) {
      if (!local_error) local_error = std::current_exception();
    }
  }
  if (local_error) {
    tracker_.recordAttempt(job.id, attempts, "interrupted by a local error");
    std::rethrow_exception(local_error);
  }

  const bool cancelled = cancelRequested(job.id);
  if (failure || cancelled) {
    abortHandle(job.id, handle);
    if (failure) throw failJob(job, attempts, failure->first, failure->second);
    throw failJob(job, attempts, "cancelled", ErrorKind::Cancelled);
  }

  // Never retried here; a resume checks the handle first.
  CompletedUpload done;
  tracker_.markCompletionRequested(job.id);
  ++attempts;
  try {
    done = remote_.completeUpload(handle, job.total_size, total);
    if (done.checksum != total) throw ChecksumMismatchError(total, done.checksum);
  } catch (const TransientNetworkError& e) {
    tracker_.recordAttempt(job.id, attempts, e.what());
    spdlog::warn("upload job {}: completion unacknowledged, job left open: {}", job.id, e.what());
    throw;
  } catch (const ArchiveError& e) {
    if (done.archive_id.empty()) {
      abortHandle(job.id, handle);
    } else {
      spdlog::error("upload job {}: vault archive {} does not match the local payload",
                    job.id, done.archive_id);
    }
    throw failJob(job, attempts, e.what(), e.kind());
  }

  tracker_.recordAttempt(job.id, attempts, "");
  tracker_.setRemoteArchiveId(job.id, done.archive_id);
  tracker_.advanceUpload(job.id, UploadJobState::Completed);
  spdlog::info("upload job {} completed: archive {} stored as {} ({} part(s) sent this run)",
               job.id, record.id, done.archive_id, sent.load());

  UploadOutcome out;
  out.job_id = job.id;
  out.strategy = TransferStrategy::MultiPart;
  out.state = UploadJobState::Completed;
  out.remote_archive_id = done.archive_id;
  out.checksum = total;
  out.attempts = attempts;
  out.parts_sent = sent;
  return out;
}

JobFailedError TransferEngine::failJob(const UploadJob& job, int attempts,
                                       const std::string& error, ErrorKind cause) {
  tracker_.recordAttempt(job.id, attempts, error);
  tracker_.advanceUpload(job.id, UploadJobState::Failed);
  spdlog::error("upload job {} for archive {} failed after {} attempt(s): {}",
                job.id, job.archive_id, attempts, error);
  return JobFailedError(job.id, attempts, error, cause);
}

void TransferEngine::abortHandle(const std::string& job_id, const std::string& handle) {
  int a = 0;
  try {
    withRetry("abort", job_id, a, [&] {
      remote_.abortUpload(handle);
      return true;
    });
    spdlog::info("upload job {}: handle {} aborted", job_id, handle);
  } catch (const NotFoundError&) {
    spdlog::info("upload job {}: handle {} already gone", job_id, handle);
  } catch (const ArchiveError& e) {
    tracker_.recordDanglingUpload(job_id, handle, e.what());
  }
}

bool TransferEngine::cancelRequested(const std::string& job_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return cancelled_.count(job_id) > 0;
}

void TransferEngine::cancel(const std::string& job_id) {
  const UploadJob job = tracker_.getUploadJob(job_id);
  if (is_terminal(job.state))
    throw ValidationError("job " + job_id + " is already " + to_string(job.state));
  if (job.completion_requested && job.handle) {
    int a = 0;
    const RemoteJobStatus status = withRetry("describe upload", job_id, a, [&] {
      return remote_.describeUpload(*job.handle);
    });
    if (status.state != RemoteJobState::InProgress)
      throw ValidationError("job " + job_id + ": handle " + *job.handle + " reports " +
                            to_string(status.state) + " after completion was requested");
  }
  tracker_.advanceUpload(job_id, UploadJobState::Cancelling, "user");

  bool running = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    running = active_.count(job_id) > 0;
    if (running) cancelled_.insert(job_id);
  }
  if (running) {
    spdlog::info("upload job {}: cancel requested, waiting for parts in flight", job_id);
    return;
  }

  // Nothing is in flight for a job that is not running here.
  if (job.handle) abortHandle(job_id, *job.handle);
  const JobFailedError err = failJob(job, job.attempts, "cancelled", ErrorKind::Cancelled);
  spdlog::info("{}", err.what());
}

// -------- retrievals --------

RetrievalJob TransferEngine::startRetrieval(const ArchiveRecord& record,
                                            const std::optional<ByteRange>& range) {
  if (!record.remote_archive_id)
    throw ValidationError("archive " + record.id + " has not been uploaded");

  const uint64_t size = record.payload_size;
  const ByteRange r = range ? *range : ByteRange{0, size ? size - 1 : 0};
  if (r.first > r.last || (size && r.last >= size))
    throw ValidationError("retrieval range " + std::to_string(r.first) + "-" + std::to_string(r.last) +
                          " is outside archive " + record.id);

  int attempts = 0;
  const std::string remote_job = withRetry("retrieval request", record.id, attempts, [&] {
    return remote_.initiateRetrieval(*record.remote_archive_id, r, "retrieve " + record.id);
  });
  RetrievalJob job = tracker_.createRetrievalJob(record.id, remote_job, r);
  spdlog::info("retrieval job {} requested for archive {} (remote job {})", job.id, record.id, remote_job);
  return job;
}

size_t TransferEngine::cleanupDangling() {
  size_t released = 0;
  for (const auto& d : tracker_.danglingUploads()) {
    int a = 0;
    try {
      withRetry("abort", d.job_id, a, [&] {
        remote_.abortUpload(d.handle);
        return true;
      });
    } catch (const NotFoundError&) {
      spdlog::info("dangling handle {} is already gone on the remote", d.handle);
    } catch (const ArchiveError& e) {
      spdlog::warn("dangling handle {} still not released: {}", d.handle, e.what());
      continue;
    }
    tracker_.clearDanglingUpload(d.handle);
    ++released;
  }
  return released;
}

} // namespace alib
