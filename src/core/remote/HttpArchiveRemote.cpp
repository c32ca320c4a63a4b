#include "HttpArchiveRemote.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <utility>

#include "core/Errors.hpp"

using nlohmann::json;

namespace alib {

namespace {

constexpr const char* kTreeHash    = "x-amz-sha256-tree-hash";
constexpr const char* kDescription = "x-amz-archive-description";
constexpr const char* kPartSize    = "x-amz-part-size";
constexpr const char* kArchiveSize = "x-amz-archive-size";
constexpr const char* kArchiveId   = "x-amz-archive-id";
constexpr const char* kUploadId    = "x-amz-multipart-upload-id";
constexpr const char* kJobId       = "x-amz-job-id";

bool is_transient(int status) {
  return status == 408 || status == 429 || status >= 500;
}

// Turns anything but a 2xx answer into the matching typed error.
void check(const httplib::Result& res, const std::string& what) {
  if (!res) throw TransientNetworkError(what + ": " + httplib::to_string(res.error()));

  const int status = res->status;
  if (status >= 200 && status < 300) return;

  std::string code;
  std::string message = res->body;
  json body = json::parse(res->body, nullptr, false);
  if (!body.is_discarded() && body.is_object()) {
    if (body.contains("code") && body["code"].is_string()) code = body["code"].get<std::string>();
    if (body.contains("message") && body["message"].is_string()) message = body["message"].get<std::string>();
  }
  const std::string detail = what + " (HTTP " + std::to_string(status) + "): " + message;

  if (is_transient(status)) throw TransientNetworkError(detail);
  if (code == "ChecksumMismatch") {
    throw ChecksumMismatchError(body.value("expected", std::string()), body.value("actual", std::string()));
  }
  if (code == "IncompleteUpload") throw IncompleteUploadError(detail);
  if (status == 404) throw NotFoundError(detail);
  throw RemoteProtocolError(detail, status);
}

std::string required_header(const httplib::Result& res, const char* name, const std::string& what) {
  std::string v = res->get_header_value(name);
  if (v.empty()) throw RemoteProtocolError(what + ": response has no " + name + " header", res->status);
  return v;
}

RemoteJobState job_state_from(const std::string& code) {
  if (code == "InProgress") return RemoteJobState::InProgress;
  if (code == "Succeeded")  return RemoteJobState::Succeeded;
  if (code == "Failed")     return RemoteJobState::Failed;
  if (code == "Expired")    return RemoteJobState::Expired;
  throw RemoteProtocolError("unknown job status code: " + code);
}

} // namespace

HttpArchiveRemote::HttpArchiveRemote(std::string baseUrl, std::string vault, std::string apiKey,
                                     int timeoutSeconds)
  : baseUrl_(std::move(baseUrl)),
    vault_(std::move(vault)),
    apiKey_(std::move(apiKey)),
    timeoutSeconds_(timeoutSeconds) {
  if (vault_.empty()) throw ValidationError("vault name must not be empty");
}

std::string HttpArchiveRemote::path(const std::string& suffix) const {
  return "/" + vault_ + suffix;
}

static void set_timeouts(httplib::Client& cli, int seconds) {
  cli.set_connection_timeout(seconds, 0);
  cli.set_read_timeout(seconds, 0);
  cli.set_write_timeout(seconds, 0);
}

static httplib::Headers with_key(const std::string& apiKey, httplib::Headers h = {}) {
  if (!apiKey.empty()) h.emplace("X-API-Key", apiKey);
  return h;
}

CompletedUpload HttpArchiveRemote::uploadArchive(const std::string& description,
                                                 std::string_view bytes,
                                                 const std::string& treeHash) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "upload archive";
  auto res = cli.Post(path("/archives"),
                      with_key(apiKey_, {{kDescription, description}, {kTreeHash, treeHash}}),
                      bytes.data(), bytes.size(), "application/octet-stream");
  check(res, what);
  CompletedUpload out;
  out.archive_id = required_header(res, kArchiveId, what);
  out.checksum = res->get_header_value(kTreeHash);
  spdlog::debug("vault stored {} bytes as {}", bytes.size(), out.archive_id);
  return out;
}

std::string HttpArchiveRemote::initiateUpload(const std::string& description, uint64_t partSize) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "initiate multipart upload";
  auto res = cli.Post(path("/multipart-uploads"),
                      with_key(apiKey_, {{kDescription, description}, {kPartSize, std::to_string(partSize)}}),
                      std::string(), "application/octet-stream");
  check(res, what);
  return required_header(res, kUploadId, what);
}

std::string HttpArchiveRemote::uploadPart(const std::string& handle, uint64_t offset,
                                          std::string_view bytes, const std::string& checksum) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "upload part at " + std::to_string(offset);
  const uint64_t last = bytes.empty() ? offset : offset + bytes.size() - 1;
  const std::string range = "bytes " + std::to_string(offset) + "-" + std::to_string(last) + "/*";
  auto res = cli.Put(path("/multipart-uploads/" + handle),
                     with_key(apiKey_, {{"Content-Range", range}, {kTreeHash, checksum}}),
                     bytes.data(), bytes.size(), "application/octet-stream");
  check(res, what);
  return required_header(res, kTreeHash, what);
}

CompletedUpload HttpArchiveRemote::completeUpload(const std::string& handle, uint64_t totalSize,
                                                  const std::string& treeHash) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "complete multipart upload";
  auto res = cli.Post(path("/multipart-uploads/" + handle),
                      with_key(apiKey_, {{kArchiveSize, std::to_string(totalSize)}, {kTreeHash, treeHash}}),
                      std::string(), "application/octet-stream");
  check(res, what);
  CompletedUpload out;
  out.archive_id = required_header(res, kArchiveId, what);
  out.checksum = res->get_header_value(kTreeHash);
  return out;
}

void HttpArchiveRemote::abortUpload(const std::string& handle) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  auto res = cli.Delete(path("/multipart-uploads/" + handle), with_key(apiKey_));
  check(res, "abort multipart upload");
}

RemoteJobStatus HttpArchiveRemote::describeUpload(const std::string& handle) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  auto res = cli.Get(path("/multipart-uploads/" + handle), with_key(apiKey_));
  if (res && res->status == 404) return {RemoteJobState::NotFound, "no such upload"};
  check(res, "describe multipart upload");
  return {RemoteJobState::InProgress, {}};
}

std::string HttpArchiveRemote::initiateRetrieval(const std::string& remoteArchiveId,
                                                 const ByteRange& range,
                                                 const std::string& description) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "initiate retrieval";
  json body = {
    {"Type", "archive-retrieval"},
    {"ArchiveId", remoteArchiveId},
    {"Description", description},
    {"RetrievalByteRange", std::to_string(range.first) + "-" + std::to_string(range.last)}
  };
  auto res = cli.Post(path("/jobs"), with_key(apiKey_), body.dump(), "application/json");
  check(res, what);
  return required_header(res, kJobId, what);
}

RemoteJobStatus HttpArchiveRemote::describeJob(const std::string& remoteJobId) {
  httplib::Client cli(baseUrl_);
  set_timeouts(cli, timeoutSeconds_);
  const std::string what = "describe job " + remoteJobId;
  auto res = cli.Get(path("/jobs/" + remoteJobId), with_key(apiKey_));
  if (res && res->status == 404) return {RemoteJobState::NotFound, "no such job"};
  check(res, what);

  json j = json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("StatusCode") || !j["StatusCode"].is_string())
    throw RemoteProtocolError(what + ": malformed job description", res->status);
  RemoteJobStatus out;
  out.state = job_state_from(j["StatusCode"].get<std::string>());
  out.detail = j.value("StatusMessage", std::string());
  return out;
}

} // namespace alib
