#pragma once
#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/remote/ArchiveRemote.hpp"
#include "core/transfer/TreeHasher.hpp"

namespace alib::test {

// In-memory vault. Verifies tree hashes like the real one and lets a test
// inject failures at each call.
class FakeRemote : public ArchiveRemote {
public:
  struct Upload {
    std::string description;
    uint64_t part_size = 0;
    std::map<uint64_t, std::string> parts;  // by offset
    bool open = true;
  };

  // -------- fault injection --------
  int single_transient_failures = 0;        // next N uploadArchive calls time out
  int complete_transient_failures = 0;      // next N completeUpload calls time out
  int complete_lost_acks = 0;               // next N completeUpload calls store the archive, then time out
  bool complete_incomplete = false;         // completeUpload answers IncompleteUpload
  bool corrupt_part_checksum = false;       // uploadPart echoes a wrong hash
  bool abort_fails = false;                 // abortUpload answers RemoteProtocolError
  bool describe_transient = false;          // describeJob times out
  std::function<void(uint64_t offset)> on_part;  // runs before a part is accepted

  // -------- observations --------
  std::atomic<int> single_calls{0};
  std::atomic<int> initiate_calls{0};
  std::atomic<int> part_calls{0};
  std::atomic<int> complete_calls{0};
  std::atomic<int> abort_calls{0};
  std::atomic<int> describe_upload_calls{0};

  CompletedUpload uploadArchive(const std::string& description, std::string_view bytes,
                                const std::string& treeHash) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++single_calls;
    if (single_transient_failures > 0) {
      --single_transient_failures;
      throw TransientNetworkError("upload timed out");
    }
    const std::string actual = tree_hash_hex(bytes);
    if (actual != treeHash) throw ChecksumMismatchError(treeHash, actual);
    const std::string id = "arch-" + std::to_string(archives_.size() + 1);
    archives_[id] = std::string(bytes);
    descriptions_[id] = description;
    return {id, actual};
  }

  std::string initiateUpload(const std::string& description, uint64_t partSize) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++initiate_calls;
    const std::string handle = "mpu-" + std::to_string(++next_handle_);
    Upload u;
    u.description = description;
    u.part_size = partSize;
    uploads_[handle] = u;
    return handle;
  }

  std::string uploadPart(const std::string& handle, uint64_t offset, std::string_view bytes,
                         const std::string& checksum) override {
    ++part_calls;
    if (on_part) on_part(offset);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = uploads_.find(handle);
    if (it == uploads_.end() || !it->second.open) throw NotFoundError("no upload " + handle);
    const std::string actual = tree_hash_hex(bytes);
    if (actual != checksum) throw ChecksumMismatchError(checksum, actual);
    it->second.parts[offset] = std::string(bytes);
    part_offsets_.push_back(offset);
    return corrupt_part_checksum ? std::string(64, '0') : actual;
  }

  CompletedUpload completeUpload(const std::string& handle, uint64_t totalSize,
                                 const std::string& treeHash) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++complete_calls;
    call_log_.push_back("completeUpload");
    if (complete_transient_failures > 0) {
      --complete_transient_failures;
      throw TransientNetworkError("complete timed out");
    }
    auto it = uploads_.find(handle);
    if (it == uploads_.end() || !it->second.open) throw NotFoundError("no upload " + handle);
    if (complete_incomplete) throw IncompleteUploadError("parts missing for " + handle);

    std::string whole;
    for (const auto& kv : it->second.parts) {
      if (kv.first != whole.size()) throw IncompleteUploadError("gap at " + std::to_string(whole.size()));
      whole += kv.second;
    }
    if (whole.size() != totalSize) throw IncompleteUploadError("size mismatch for " + handle);
    const std::string actual = tree_hash_hex(whole);
    if (actual != treeHash) throw ChecksumMismatchError(treeHash, actual);

    it->second.open = false;
    const std::string id = "arch-" + std::to_string(archives_.size() + 1);
    archives_[id] = whole;
    descriptions_[id] = it->second.description;
    call_log_.push_back("complete");
    if (complete_lost_acks > 0) {
      --complete_lost_acks;
      throw TransientNetworkError("connection reset before the completion answer");
    }
    return {id, actual};
  }

  void abortUpload(const std::string& handle) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++abort_calls;
    if (abort_fails) throw RemoteProtocolError("abort refused", 403);
    auto it = uploads_.find(handle);
    if (it == uploads_.end() || !it->second.open) throw NotFoundError("no upload " + handle);
    it->second.open = false;
  }

  RemoteJobStatus describeUpload(const std::string& handle) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++describe_upload_calls;
    call_log_.push_back("describeUpload");
    auto forced = upload_states_.find(handle);
    if (forced != upload_states_.end()) return {forced->second, "forced"};
    auto it = uploads_.find(handle);
    if (it == uploads_.end() || !it->second.open) return {RemoteJobState::NotFound, ""};
    return {RemoteJobState::InProgress, ""};
  }

  std::string initiateRetrieval(const std::string& remoteArchiveId, const ByteRange& range,
                                const std::string&) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (!archives_.count(remoteArchiveId)) throw NotFoundError("no archive " + remoteArchiveId);
    const std::string id = "job-" + std::to_string(jobs_.size() + 1);
    jobs_[id] = RemoteJobState::InProgress;
    ranges_[id] = range;
    return id;
  }

  RemoteJobStatus describeJob(const std::string& remoteJobId) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (describe_transient) throw TransientNetworkError("describe timed out");
    auto it = jobs_.find(remoteJobId);
    if (it == jobs_.end()) return {RemoteJobState::NotFound, ""};
    return {it->second, ""};
  }

  // -------- test controls --------
  void setJobState(const std::string& remoteJobId, RemoteJobState s) {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_[remoteJobId] = s;
  }
  void forgetJob(const std::string& remoteJobId) {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.erase(remoteJobId);
  }
  void setUploadState(const std::string& handle, RemoteJobState s) {
    std::lock_guard<std::mutex> lk(mu_);
    upload_states_[handle] = s;
  }
  std::string archive(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = archives_.find(id);
    return it == archives_.end() ? std::string() : it->second;
  }
  std::string description(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = descriptions_.find(id);
    return it == descriptions_.end() ? std::string() : it->second;
  }
  ByteRange range(const std::string& remoteJobId) const {
    std::lock_guard<std::mutex> lk(mu_);
    return ranges_.at(remoteJobId);
  }
  bool uploadOpen(const std::string& handle) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = uploads_.find(handle);
    return it != uploads_.end() && it->second.open;
  }
  std::vector<uint64_t> partOffsets() const {
    std::lock_guard<std::mutex> lk(mu_);
    auto v = part_offsets_;
    std::sort(v.begin(), v.end());
    return v;
  }
  // Order of completeUpload and describeUpload calls; "complete" marks a
  // completion the vault actually applied.
  std::vector<std::string> callLog() const {
    std::lock_guard<std::mutex> lk(mu_);
    return call_log_;
  }
  void resetCounters() {
    describe_upload_calls = 0;
    single_calls = 0;
    initiate_calls = 0;
    part_calls = 0;
    complete_calls = 0;
    abort_calls = 0;
    std::lock_guard<std::mutex> lk(mu_);
    part_offsets_.clear();
    call_log_.clear();
  }

private:
  mutable std::mutex mu_;
  int next_handle_ = 0;
  std::map<std::string, Upload> uploads_;
  std::map<std::string, RemoteJobState> upload_states_;
  std::map<std::string, std::string> archives_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, RemoteJobState> jobs_;
  std::map<std::string, ByteRange> ranges_;
  std::vector<uint64_t> part_offsets_;
  std::vector<std::string> call_log_;
};

} // namespace alib::test
