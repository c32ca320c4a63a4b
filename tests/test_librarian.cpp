#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include "FakeRemote.hpp"
#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/Librarian.hpp"
#include "core/transfer/TreeHasher.hpp"

using namespace alib;
using namespace std::chrono_literals;
using alib::test::FakeRemote;
using alib::test::TempDir;
using alib::test::make_bytes;

namespace fs = std::filesystem;

namespace {

class RecordingVcs : public VersionControl {
public:
  std::string commit(const std::string& ledgerSnapshot) override {
    if (fail) throw std::runtime_error("git is unhappy");
    snapshots.push_back(ledgerSnapshot);
    return "c" + std::to_string(snapshots.size());
  }
  void push() override { ++pushes; }

  bool fail = false;
  std::vector<std::string> snapshots;
  int pushes = 0;
};

class LibrarianTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = dir.str("library");
    source = dir.str("source");
    fs::create_directories(source);
    config.retry.backoff_base = 1ms;
    config.retry.backoff_max = 1ms;
  }

  void open() {
    if (!Librarian::isInitialized(root)) Librarian::initRepository(root, ALIB_SCHEMA_PATH);
    lib = std::make_unique<Librarian>(root, ALIB_SCHEMA_PATH, config, remote, &vcs);
  }

  CreateArchiveRequest request(const std::string& payload) {
    const std::string path = dir.str("payload-" + std::to_string(++payloads) + ".bin");
    alib::test::write_file(path, payload);
    CreateArchiveRequest req;
    req.source_path = source;
    req.description = "family photos";
    req.files = {{"2019/a.jpg", payload.size()}};
    req.payload_path = path;
    return req;
  }

  size_t pendingBlobs() const {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(fs::path(root) / "blobs" / "pending")) {
      (void)e;
      ++n;
    }
    return n;
  }

  TempDir dir;
  std::string root;
  std::string source;
  int payloads = 0;
  EngineConfig config;
  FakeRemote remote;
  RecordingVcs vcs;
  std::unique_ptr<Librarian> lib;
};

} // namespace

TEST_F(LibrarianTest, InitCreatesLayoutOnce) {
  EXPECT_FALSE(Librarian::isInitialized(root));
  Librarian::initRepository(root, ALIB_SCHEMA_PATH);
  EXPECT_TRUE(Librarian::isInitialized(root));
  EXPECT_TRUE(fs::exists(fs::path(root) / "ledger.db"));
  EXPECT_TRUE(fs::is_directory(fs::path(root) / "blobs" / "pending"));
  EXPECT_TRUE(fs::is_directory(fs::path(root) / "blobs" / "confirmed"));
  EXPECT_THROW(Librarian::initRepository(root, ALIB_SCHEMA_PATH), ValidationError);
}

TEST_F(LibrarianTest, OpeningAMissingRepositoryFails) {
  EXPECT_THROW(Librarian missing(root, ALIB_SCHEMA_PATH, config, remote), NotFoundError);
}

TEST_F(LibrarianTest, CreateStagesPayloadAndCommits) {
  open();
  const std::string payload = make_bytes(4000);
  const ArchiveRecord r = lib->createArchive(request(payload));

  EXPECT_EQ(r.payload_size, payload.size());
  EXPECT_EQ(r.payload_checksum, tree_hash_hex(payload));
  EXPECT_TRUE(lib->blobs().exists(r.id));
  EXPECT_FALSE(lib->blobs().isConfirmed(r.id));
  EXPECT_EQ(lib->resolveReference(r.id.substr(0, 5)).id, r.id);
  ASSERT_EQ(lib->listArchives().size(), 1u);

  ASSERT_EQ(vcs.snapshots.size(), 1u);
  EXPECT_NE(vcs.snapshots[0].find(r.id), std::string::npos);
  EXPECT_EQ(vcs.pushes, 1);
}

TEST_F(LibrarianTest, RejectedCreateLeavesNothingBehind) {
  open();
  CreateArchiveRequest req = request(make_bytes(10));
  req.files.clear();
  EXPECT_THROW(lib->createArchive(req), ValidationError);

  req = request(make_bytes(10));
  req.payload_path = dir.str("missing.bin");
  EXPECT_THROW(lib->createArchive(req), ValidationError);

  EXPECT_EQ(lib->listArchives().size(), 0u);
  EXPECT_EQ(pendingBlobs(), 0u);
  EXPECT_TRUE(vcs.snapshots.empty());
}

TEST_F(LibrarianTest, CreateFromBytes) {
  open();
  CreateArchiveRequest req = request("");
  req.payload_path.clear();
  const std::string payload = make_bytes(777, 4);
  const ArchiveRecord r = lib->createArchiveFromBytes(req, payload);
  EXPECT_EQ(lib->blobs().read(r.id, 0, payload.size()), payload);
}

TEST_F(LibrarianTest, UploadConfirmsRecordAndPayload) {
  open();
  const std::string payload = make_bytes(2048, 2);
  const ArchiveRecord r = lib->createArchive(request(payload));

  const UploadOutcome out = lib->startUpload(r.id.substr(0, 6));
  const ArchiveRecord after = lib->resolveReference(r.id);
  EXPECT_EQ(after.upload_status, UploadStatus::Completed);
  ASSERT_TRUE(after.remote_archive_id.has_value());
  EXPECT_EQ(*after.remote_archive_id, out.remote_archive_id);
  EXPECT_TRUE(lib->blobs().isConfirmed(r.id));
  EXPECT_EQ(remote.archive(out.remote_archive_id), payload);

  EXPECT_THROW(lib->startUpload(r.id), ValidationError);
}

TEST_F(LibrarianTest, FailedUploadIsRecordedAndCanBeRestarted) {
  config.retry.max_attempts = 2;
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(100)));
  remote.single_transient_failures = 5;

  EXPECT_THROW(lib->startUpload(r.id), JobFailedError);
  EXPECT_EQ(lib->resolveReference(r.id).upload_status, UploadStatus::Failed);
  EXPECT_FALSE(lib->blobs().isConfirmed(r.id));

  remote.single_transient_failures = 0;
  lib->startUpload(r.id);
  EXPECT_EQ(lib->resolveReference(r.id).upload_status, UploadStatus::Completed);
  EXPECT_EQ(lib->jobs().uploadJobs().size(), 2u);
}

TEST_F(LibrarianTest, InterruptedUploadResumesOrCancels) {
  config.single_part_threshold = kMiB;
  config.part_limits.min_part_size = kMiB;
  open();
  const ArchiveRecord a = lib->createArchive(request(make_bytes(2 * kMiB + 3, 5)));
  const ArchiveRecord b = lib->createArchive(request(make_bytes(2 * kMiB + 9, 6)));

  remote.complete_transient_failures = 2;
  EXPECT_THROW(lib->startUpload(a.id), TransientNetworkError);
  EXPECT_THROW(lib->startUpload(b.id), TransientNetworkError);
  EXPECT_EQ(lib->resolveReference(a.id).upload_status, UploadStatus::InProgress);

  const auto openJobs = lib->jobs().uploadJobs(true);
  ASSERT_EQ(openJobs.size(), 2u);
  const std::string jobA = openJobs[0].archive_id == a.id ? openJobs[0].id : openJobs[1].id;
  const std::string jobB = openJobs[0].archive_id == a.id ? openJobs[1].id : openJobs[0].id;

  lib->resumeUpload(jobA);
  EXPECT_EQ(lib->resolveReference(a.id).upload_status, UploadStatus::Completed);

  lib->cancelUpload(jobB);
  EXPECT_EQ(lib->resolveReference(b.id).upload_status, UploadStatus::Failed);
  EXPECT_EQ(remote.abort_calls.load(), 1);
}

TEST_F(LibrarianTest, LostCompletionAnswerLeavesTheUploadOpen) {
  config.single_part_threshold = kMiB;
  config.part_limits.min_part_size = kMiB;
  open();
  const std::string payload = make_bytes(2 * kMiB + 5, 9);
  const ArchiveRecord r = lib->createArchive(request(payload));
  remote.complete_lost_acks = 1;

  EXPECT_THROW(lib->startUpload(r.id), TransientNetworkError);
  const std::string job = lib->jobs().uploadJobs(true).at(0).id;

  EXPECT_THROW(lib->resumeUpload(job), ReconciliationAnomaly);
  EXPECT_EQ(lib->resolveReference(r.id).upload_status, UploadStatus::InProgress);
  EXPECT_EQ(remote.complete_calls.load(), 1);

  lib->checkJobs();
  EXPECT_EQ(lib->resolveReference(r.id).upload_status, UploadStatus::InProgress);
  EXPECT_EQ(remote.archive("arch-1"), payload);
}

TEST_F(LibrarianTest, RetrievalLifecycleIsMirroredOnTheRecord) {
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(512, 7)));
  EXPECT_THROW(lib->startRetrieval(r.id), ValidationError);
  lib->startUpload(r.id);

  const RetrievalJob job = lib->startRetrieval(r.id);
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Pending);

  remote.setJobState(job.remote_job_id, RemoteJobState::Succeeded);
  auto results = lib->checkJobs();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].advanced);
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Ready);
  EXPECT_THROW(lib->startRetrieval(r.id), ValidationError);

  remote.forgetJob(job.remote_job_id);
  lib->checkJobs();
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Expired);

  EXPECT_NO_THROW(lib->startRetrieval(r.id, ByteRange{0, 99}));
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Pending);
}

TEST_F(LibrarianTest, OnlyOneRetrievalIsOpenPerArchive) {
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(256, 10)));
  lib->startUpload(r.id);

  const RetrievalJob first = lib->startRetrieval(r.id);
  EXPECT_THROW(lib->startRetrieval(r.id), ValidationError);

  remote.setJobState(first.remote_job_id, RemoteJobState::Succeeded);
  lib->checkJobs();
  EXPECT_THROW(lib->startRetrieval(r.id), ValidationError);

  remote.forgetJob(first.remote_job_id);
  lib->checkJobs();
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Expired);

  const RetrievalJob second = lib->startRetrieval(r.id);
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Pending);
  remote.setJobState(second.remote_job_id, RemoteJobState::Succeeded);
  EXPECT_NO_THROW(lib->checkJobs());
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Ready);
  EXPECT_EQ(lib->jobs().retrievalJobs().size(), 2u);
}

TEST_F(LibrarianTest, RecordFollowsTheLatestRetrievalJob) {
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(256, 11)));
  lib->startUpload(r.id);
  const RetrievalJob older = lib->startRetrieval(r.id);
  remote.setJobState(older.remote_job_id, RemoteJobState::Succeeded);
  lib->checkJobs();
  ASSERT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Ready);

  // A second job recorded next to the first, as an older ledger could hold.
  const std::string remoteJob =
      remote.initiateRetrieval(*lib->resolveReference(r.id).remote_archive_id, ByteRange{0, 9}, "");
  const RetrievalJob newer = lib->jobs().createRetrievalJob(r.id, remoteJob, ByteRange{0, 9});

  // READY cannot step back to the newer job's IN_PROGRESS: logged, not thrown.
  std::vector<ReconcileResult> results;
  EXPECT_NO_THROW(results = lib->checkJobs());
  EXPECT_EQ(results.size(), 2u);
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Ready);

  remote.forgetJob(older.remote_job_id);
  remote.setJobState(remoteJob, RemoteJobState::Succeeded);
  lib->checkJobs();
  remote.forgetJob(remoteJob);
  lib->checkJobs();
  EXPECT_EQ(lib->jobs().findRetrievalJob(newer.id)->state, RetrievalStatus::Expired);
  EXPECT_EQ(*lib->resolveReference(r.id).retrieval_status, RetrievalStatus::Expired);
}

TEST_F(LibrarianTest, CheckJobsReportsAnomaliesWithoutThrowing) {
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(64, 8)));
  lib->startUpload(r.id);
  const RetrievalJob job = lib->startRetrieval(r.id);
  remote.forgetJob(job.remote_job_id);

  const auto results = lib->checkJobs();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].anomaly.has_value());
  EXPECT_EQ(lib->jobs().anomalies().size(), 1u);
}

TEST_F(LibrarianTest, VersionControlFailureDoesNotUndoChanges) {
  open();
  vcs.fail = true;
  const ArchiveRecord r = lib->createArchive(request(make_bytes(32)));
  EXPECT_EQ(lib->listArchives().size(), 1u);
  EXPECT_EQ(lib->resolveReference(r.id).id, r.id);
}

TEST_F(LibrarianTest, ReopenSeesEverything) {
  open();
  const ArchiveRecord r = lib->createArchive(request(make_bytes(32)));
  lib->startUpload(r.id);
  lib.reset();

  open();
  const ArchiveRecord again = lib->resolveReference(r.id);
  EXPECT_EQ(again.upload_status, UploadStatus::Completed);
  EXPECT_EQ(lib->cleanupDangling(), 0u);
}
