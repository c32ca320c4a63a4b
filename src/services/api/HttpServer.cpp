#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/Librarian.hpp"

using nlohmann::json;

namespace alib {

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static int status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:            return 422;
    case ErrorKind::AmbiguousReference:    return 409;
    case ErrorKind::NotFound:              return 404;
    case ErrorKind::TransientNetwork:      return 503;
    case ErrorKind::ChecksumMismatch:
    case ErrorKind::RemoteProtocol:
    case ErrorKind::IncompleteUpload:
    case ErrorKind::JobFailed:             return 502;
    case ErrorKind::ReconciliationAnomaly: return 409;
    case ErrorKind::Cancelled:             return 409;
  }
  return 500;
}

// Runs a handler and turns the typed errors into JSON answers.
static void guarded(const httplib::Request& req, httplib::Response& res,
                    const std::string& apiKey, const std::function<void()>& fn) {
  if (!check_api_key(req, apiKey, res)) return;
  try {
    fn();
  } catch (const ArchiveError& e) {
    json body = {{"error", to_string(e.kind())}, {"message", e.what()}};
    if (auto* amb = dynamic_cast<const AmbiguousReferenceError*>(&e)) {
      body["candidates"] = amb->candidates();
    } else if (auto* failed = dynamic_cast<const JobFailedError*>(&e)) {
      body["job_id"] = failed->jobId();
      body["attempts"] = failed->attempts();
      body["last_error"] = failed->lastError();
      body["cause"] = to_string(failed->cause());
    }
    if (e.kind() == ErrorKind::JobFailed || e.kind() == ErrorKind::TransientNetwork)
      spdlog::warn("{} {}: {}", req.method, req.path, e.what());
    send_json(res, status_for(e.kind()), body);
  } catch (const std::exception& e) {
    spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    send_json(res, 500, {{"error", "internal"}, {"message", e.what()}});
  }
}

static json record_json(const ArchiveRecord& r) {
  json files = json::array();
  for (const auto& f : r.files) files.push_back({{"path", f.path}, {"size", f.size}});
  json j = {
    {"id", r.id},
    {"source_path", r.source_path},
    {"created_at", r.created_at},
    {"description", r.description},
    {"files", files},
    {"payload_checksum", r.payload_checksum},
    {"payload_size", r.payload_size},
    {"upload_status", to_string(r.upload_status)},
    {"updated_at", r.updated_at}
  };
  j["retrieval_status"] = r.retrieval_status ? json(to_string(*r.retrieval_status)) : json(nullptr);
  j["remote_archive_id"] = r.remote_archive_id ? json(*r.remote_archive_id) : json(nullptr);
  return j;
}

static json upload_job_json(const UploadJob& job) {
  size_t confirmed = 0;
  for (const auto& p : job.parts) if (p.confirmed) ++confirmed;
  json j = {
    {"id", job.id},
    {"archive_id", job.archive_id},
    {"strategy", to_string(job.strategy)},
    {"state", to_string(job.state)},
    {"total_size", job.total_size},
    {"part_size", job.part_size},
    {"parts", job.parts.size()},
    {"parts_confirmed", confirmed},
    {"attempts", job.attempts},
    {"last_error", job.last_error}
  };
  j["handle"] = job.handle ? json(*job.handle) : json(nullptr);
  j["remote_archive_id"] = job.remote_archive_id ? json(*job.remote_archive_id) : json(nullptr);
  return j;
}

static json retrieval_job_json(const RetrievalJob& job) {
  return {
    {"id", job.id},
    {"archive_id", job.archive_id},
    {"remote_job_id", job.remote_job_id},
    {"state", to_string(job.state)},
    {"range", {{"first", job.range.first}, {"last", job.range.last}}},
    {"requested_at", job.requested_at}
  };
}

static json outcome_json(const UploadOutcome& o) {
  return {
    {"job_id", o.job_id},
    {"strategy", to_string(o.strategy)},
    {"state", to_string(o.state)},
    {"remote_archive_id", o.remote_archive_id},
    {"checksum", o.checksum},
    {"attempts", o.attempts},
    {"parts_sent", o.parts_sent}
  };
}

static std::vector<FileEntry> files_from(const json& j) {
  std::vector<FileEntry> out;
  if (!j.is_array()) throw ValidationError("metadata.files must be an array");
  for (const auto& f : j) {
    if (!f.is_object() || !f.contains("path") || !f["path"].is_string())
      throw ValidationError("every file entry needs a path");
    FileEntry e;
    e.path = f["path"].get<std::string>();
    if (f.contains("size") && f["size"].is_number_unsigned()) e.size = f["size"].get<uint64_t>();
    out.push_back(std::move(e));
  }
  return out;
}

// A payload named by path must live under the archive's source directory.
static void check_payload_path(const std::string& source, const std::string& payload) {
  namespace fs = std::filesystem;
  if (source.empty()) throw ValidationError("payload_path needs a source_path");
  const fs::path rel = fs::weakly_canonical(payload).lexically_relative(fs::weakly_canonical(source));
  if (rel.empty() || *rel.begin() == "..")
    throw ValidationError("payload_path " + payload + " is outside " + source);
}

static uint64_t u64_param(const httplib::Request& req, const char* k) {
  const std::string s = param_or(req, k);
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
    throw ValidationError(std::string("query parameter ") + k + " must be a non-negative integer");
  return std::stoull(s);
}

// -------- routes --------

void install_routes(httplib::Server& svr, Librarian& lib, const std::string& apiKey) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /archives
  // Metadata: X-ALIB-Meta: <JSON>  (or)  ?meta=<urlencoded JSON>
  //   {"source_path": "...", "description": "...", "files": [{"path":..,"size":..}],
  //    "payload_path": "..."}
  // Body: raw payload bytes, unless payload_path names a file under source_path.
  svr.Post("/archives", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      std::string meta_json = req.get_header_value("X-ALIB-Meta");
      if (meta_json.empty()) meta_json = param_or(req, "meta", "");
      json j = json::parse(meta_json.empty() ? std::string("{}") : meta_json, nullptr, false);
      if (j.is_discarded() || !j.is_object()) throw ValidationError("invalid JSON in metadata");

      CreateArchiveRequest cr;
      cr.source_path  = j.value("source_path", std::string());
      cr.description  = j.value("description", std::string());
      cr.files        = files_from(j.contains("files") ? j["files"] : json::array());
      cr.payload_path = j.value("payload_path", std::string());

      ArchiveRecord r;
      if (!cr.payload_path.empty()) {
        check_payload_path(cr.source_path, cr.payload_path);
        r = lib.createArchive(cr);
      } else {
        if (req.body.empty()) throw ValidationError("empty body and no payload_path");
        r = lib.createArchiveFromBytes(cr, req.body);
      }
      send_json(res, 201, record_json(r));
    });
  });

  // GET /archives?limit=N  (most recent first)
  svr.Get("/archives", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      const size_t limit = req.has_param("limit") ? static_cast<size_t>(u64_param(req, "limit")) : 0;
      json arr = json::array();
      for (const auto& r : lib.listArchives(limit)) arr.push_back(record_json(r));
      send_json(res, 200, arr);
    });
  });

  // GET /archives/{reference}  (full id or unique prefix)
  svr.Get(R"(/archives/([^/]+))", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      send_json(res, 200, record_json(lib.resolveReference(req.matches[1])));
    });
  });

  svr.Post(R"(/archives/([^/]+)/upload)", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      send_json(res, 200, outcome_json(lib.startUpload(req.matches[1])));
    });
  });

  // POST /archives/{reference}/retrieve[?first=..&last=..]
  svr.Post(R"(/archives/([^/]+)/retrieve)", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      std::optional<ByteRange> range;
      if (req.has_param("first") || req.has_param("last"))
        range = ByteRange{u64_param(req, "first"), u64_param(req, "last")};
      send_json(res, 202, retrieval_job_json(lib.startRetrieval(req.matches[1], range)));
    });
  });

  // GET /jobs?open=1
  svr.Get("/jobs", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      const bool open_only = param_or(req, "open") == "1";
      json uploads = json::array();
      for (const auto& j : lib.jobs().uploadJobs(open_only)) uploads.push_back(upload_job_json(j));
      json retrievals = json::array();
      for (const auto& j : lib.jobs().retrievalJobs(open_only)) retrievals.push_back(retrieval_job_json(j));
      send_json(res, 200, {{"uploads", uploads}, {"retrievals", retrievals}});
    });
  });

  svr.Post("/jobs/check", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      json arr = json::array();
      for (const auto& r : lib.checkJobs()) {
        json j = {
          {"job_id", r.job_id},
          {"kind", to_string(r.kind)},
          {"before", r.before},
          {"after", r.after},
          {"advanced", r.advanced}
        };
        j["anomaly"] = r.anomaly ? json(r.anomaly->detail) : json(nullptr);
        arr.push_back(j);
      }
      send_json(res, 200, arr);
    });
  });

  svr.Post(R"(/jobs/([^/]+)/resume)", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      send_json(res, 200, outcome_json(lib.resumeUpload(req.matches[1])));
    });
  });

  svr.Post(R"(/jobs/([^/]+)/cancel)", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      const std::string id = req.matches[1];
      lib.cancelUpload(id);
      send_json(res, 202, upload_job_json(lib.jobs().getUploadJob(id)));
    });
  });

  svr.Post("/dangling/cleanup", [&lib, apiKey](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, apiKey, [&] {
      const size_t released = lib.cleanupDangling();
      send_json(res, 200, {{"released", released},
                           {"remaining", lib.jobs().danglingUploads().size()}});
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

// -------- server --------

void run_http_server(Librarian& lib, int port, const std::string& apiKey) {
  httplib::Server svr;
  install_routes(svr, lib, apiKey);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace alib
