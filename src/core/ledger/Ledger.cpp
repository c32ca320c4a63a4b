#include "Ledger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "core/Errors.hpp"
#include "core/crypto/Sha256.hpp"
#include "core/ledger/InitDb.hpp"

using nlohmann::json;

namespace alib {

// -------- helpers --------

static json files_to_json(const std::vector<FileEntry>& files) {
  json arr = json::array();
  for (const auto& f : files) arr.push_back({{"path", f.path}, {"size", f.size}});
  return arr;
}

static json record_to_json(const ArchiveRecord& r) {
  json j = {
    {"id", r.id},
    {"source_path", r.source_path},
    {"created_at", r.created_at},
    {"description", r.description},
    {"files", files_to_json(r.files)},
    {"payload_checksum", r.payload_checksum},
    {"payload_size", r.payload_size},
    {"upload_status", to_string(r.upload_status)},
    {"updated_at", r.updated_at}
  };
  j["retrieval_status"] = r.retrieval_status ? json(to_string(*r.retrieval_status)) : json(nullptr);
  j["remote_archive_id"] = r.remote_archive_id ? json(*r.remote_archive_id) : json(nullptr);
  return j;
}

static void check_source_readable(const std::string& sourcePath) {
  namespace fs = std::filesystem;
  if (sourcePath.empty()) throw ValidationError("source path is empty");

  std::error_code ec;
  const auto st = fs::status(sourcePath, ec);
  if (ec || !fs::exists(st)) throw ValidationError("source path does not exist: " + sourcePath);

  if (fs::is_directory(st)) {
    fs::directory_iterator it(sourcePath, ec);
    if (ec) throw ValidationError("source path is unreadable: " + sourcePath + " (" + ec.message() + ")");
    return;
  }
  std::ifstream in(sourcePath, std::ios::binary);
  if (!in) throw ValidationError("source path is unreadable: " + sourcePath);
}

static void check_files(const std::vector<FileEntry>& files) {
  if (files.empty()) throw ValidationError("file list is empty");
  for (const auto& f : files) {
    if (f.path.empty()) throw ValidationError("file list contains an empty path");
    if (std::filesystem::path(f.path).is_absolute())
      throw ValidationError("file list path must be relative: " + f.path);
  }
}

static int upload_rank(UploadStatus s) {
  switch (s) {
    case UploadStatus::None:       return 0;
    case UploadStatus::Pending:    return 1;
    case UploadStatus::InProgress: return 2;
    case UploadStatus::Completed:
    case UploadStatus::Failed:     return 3;
  }
  return 0;
}

static int retrieval_rank(RetrievalStatus s) {
  switch (s) {
    case RetrievalStatus::Pending:    return 0;
    case RetrievalStatus::InProgress: return 1;
    case RetrievalStatus::Ready:      return 2;
    case RetrievalStatus::Expired:
    case RetrievalStatus::Failed:     return 3;
  }
  return 0;
}

static bool newer_first(const ArchiveRecord& a, const ArchiveRecord& b) {
  if (a.created_at != b.created_at) return a.created_at > b.created_at;
  return a.id < b.id;
}

// -------- Ledger --------

Ledger::Ledger(Database& db, const EngineConfig& config) : db_(db), config_(config) {
  validate(config_);
  load();
}

std::shared_ptr<const Ledger::Snapshot> Ledger::current() const {
  return std::atomic_load(&snap_);
}

void Ledger::publish(std::shared_ptr<const Snapshot> next) {
  std::atomic_store(&snap_, std::move(next));
}

void Ledger::load() {
  auto snap = std::make_shared<Snapshot>();
  std::vector<std::string> ids;

  Statement st(db_, R"SQL(
    SELECT id, source_path, created_at, description, payload_checksum, payload_size,
           upload_status, retrieval_status, remote_archive_id, updated_at
    FROM archives
  )SQL");
  while (st.step()) {
    ArchiveRecord r;
    r.id               = st.text(0);
    r.source_path      = st.text(1);
    r.created_at       = st.int64(2);
    r.description      = st.text(3);
    r.payload_checksum = st.text(4);
    r.payload_size     = static_cast<uint64_t>(st.int64(5));
    r.upload_status    = upload_status_from(st.text(6));
    if (!st.isNull(7)) r.retrieval_status = retrieval_status_from(st.text(7));
    if (!st.isNull(8)) r.remote_archive_id = st.text(8);
    r.updated_at       = st.int64(9);
    ids.push_back(r.id);
    snap->records.emplace(r.id, std::move(r));
  }

  Statement files(db_, "SELECT archive_id, path, size FROM archive_files ORDER BY archive_id, position");
  while (files.step()) {
    auto it = snap->records.find(files.text(0));
    if (it == snap->records.end()) continue;
    it->second.files.push_back({files.text(1), static_cast<uint64_t>(files.int64(2))});
  }

  snap->index = ReferenceIndex(std::move(ids));
  spdlog::debug("ledger {} loaded with {} archive(s)", db_.path(), snap->records.size());
  publish(std::move(snap));
}

std::string Ledger::generateId(const RecordDraft& draft, int64_t created_at) const {
  Sha256 h;
  h.update(files_to_json(draft.files).dump());
  h.update("\n" + std::to_string(created_at) + "\n");
  h.update(random_bytes(16));
  return to_hex(h.finish()).substr(0, static_cast<size_t>(config_.id_hex_length));
}

ArchiveRecord Ledger::createRecord(const RecordDraft& draft, const StageFn& beforeCommit) {
  check_files(draft.files);
  check_source_readable(draft.source_path);

  WriteTransaction tx(db_);
  auto base = current();

  ArchiveRecord r;
  r.created_at = unix_now();
  r.updated_at = r.created_at;
  for (int tries = 0;; ++tries) {
    r.id = generateId(draft, r.created_at);
    if (!base->index.contains(r.id)) break;
    if (tries >= 8) throw std::runtime_error("could not generate a unique archive identifier");
    spdlog::warn("identifier collision on {}, regenerating", r.id);
  }
  r.source_path      = draft.source_path;
  r.description      = draft.description;
  r.files            = draft.files;
  r.payload_checksum = draft.payload_checksum;
  r.payload_size     = draft.payload_size;

  Statement ins(db_, R"SQL(
    INSERT INTO archives
      (id, source_path, created_at, description, payload_checksum, payload_size,
       upload_status, updated_at)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  ins.bindText(i++, r.id);
  ins.bindText(i++, r.source_path);
  ins.bindInt64(i++, r.created_at);
  ins.bindText(i++, r.description);
  ins.bindText(i++, r.payload_checksum);
  ins.bindInt64(i++, static_cast<int64_t>(r.payload_size));
  ins.bindText(i++, to_string(r.upload_status));
  ins.bindInt64(i++, r.updated_at);
  ins.run();

  Statement file(db_, "INSERT INTO archive_files (archive_id, position, path, size) VALUES (?,?,?,?)");
  for (size_t pos = 0; pos < r.files.size(); ++pos) {
    file.bindText(1, r.id)
        .bindInt64(2, static_cast<int64_t>(pos))
        .bindText(3, r.files[pos].path)
        .bindInt64(4, static_cast<int64_t>(r.files[pos].size));
    file.run();
    file.reset();
  }

  insertHistory(r.id, "CREATED",
                json({{"files", r.files.size()}, {"source_path", r.source_path}}).dump(),
                r.created_at, "engine");

  if (beforeCommit) beforeCommit(r);
  tx.commit();

  auto next = std::make_shared<Snapshot>(*base);
  next->records.emplace(r.id, r);
  next->index.insert(r.id);
  publish(std::move(next));

  spdlog::info("archive {} created from {} ({} file(s))", r.id, r.source_path, r.files.size());
  return r;
}

ArchiveRecord Ledger::resolveReference(const std::string& prefix) const {
  if (prefix.empty()) throw ValidationError("empty archive reference");
  auto snap = current();

  // A full identifier that also prefixes a longer one is still ambiguous.
  auto matches = snap->index.matching(prefix);
  if (matches.empty()) throw NotFoundError("no archive matches '" + prefix + "'");
  if (matches.size() > 1) throw AmbiguousReferenceError(prefix, std::move(matches));
  return snap->records.at(matches.front());
}

std::optional<ArchiveRecord> Ledger::findRecord(const std::string& id) const {
  auto snap = current();
  auto it = snap->records.find(id);
  if (it == snap->records.end()) return std::nullopt;
  return it->second;
}

ArchiveRecord Ledger::getRecord(const std::string& id) const {
  auto r = findRecord(id);
  if (!r) throw NotFoundError("no archive with id " + id);
  return *r;
}

std::vector<ArchiveRecord> Ledger::listRecords(size_t limit) const {
  auto snap = current();
  std::vector<ArchiveRecord> out;
  out.reserve(snap->records.size());
  for (const auto& kv : snap->records) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), newer_first);
  if (limit && out.size() > limit) out.resize(limit);
  return out;
}

size_t Ledger::size() const { return current()->records.size(); }

bool Ledger::updateUploadStatus(const std::string& id, UploadStatus status,
                                const std::optional<std::string>& remoteArchiveId) {
  WriteTransaction tx(db_);
  auto base = current();
  auto it = base->records.find(id);
  if (it == base->records.end()) throw NotFoundError("no archive with id " + id);
  const ArchiveRecord& cur = it->second;

  if (cur.upload_status == status) return false;
  // A failed upload may be started over; everything else only moves forward.
  const bool restart = cur.upload_status == UploadStatus::Failed && status == UploadStatus::Pending;
  if (!restart && (is_terminal(cur.upload_status) || upload_rank(status) < upload_rank(cur.upload_status))) {
    throw ValidationError(std::string("archive ") + id + ": cannot move upload status from " +
                          to_string(cur.upload_status) + " to " + to_string(status));
  }

  const int64_t now = unix_now();
  Statement up(db_, R"SQL(
    UPDATE archives SET upload_status = ?, remote_archive_id = COALESCE(?, remote_archive_id),
                        updated_at = ?
    WHERE id = ?
  )SQL");
  up.bindText(1, to_string(status));
  if (remoteArchiveId) up.bindText(2, *remoteArchiveId); else up.bindNull(2);
  up.bindInt64(3, now);
  up.bindText(4, id);
  up.run();

  json details = {{"from", to_string(cur.upload_status)}, {"to", to_string(status)}};
  if (remoteArchiveId) details["remote_archive_id"] = *remoteArchiveId;
  insertHistory(id, "UPLOAD_STATUS", details.dump(), now, "engine");
  tx.commit();

  auto next = std::make_shared<Snapshot>(*base);
  auto& rec = next->records.at(id);
  rec.upload_status = status;
  if (remoteArchiveId) rec.remote_archive_id = *remoteArchiveId;
  rec.updated_at = now;
  publish(std::move(next));
  return true;
}

bool Ledger::updateRetrievalStatus(const std::string& id, RetrievalStatus status) {
  WriteTransaction tx(db_);
  auto base = current();
  auto it = base->records.find(id);
  if (it == base->records.end()) throw NotFoundError("no archive with id " + id);
  const ArchiveRecord& cur = it->second;

  if (cur.retrieval_status) {
    const RetrievalStatus was = *cur.retrieval_status;
    if (was == status) return false;
    // A new retrieval may be requested once the previous one is over.
    const bool restart = is_terminal(was) && status == RetrievalStatus::Pending;
    if (!restart && (is_terminal(was) || retrieval_rank(status) < retrieval_rank(was))) {
      throw ValidationError(std::string("archive ") + id + ": cannot move retrieval status from " +
                            to_string(was) + " to " + to_string(status));
    }
  }

  const int64_t now = unix_now();
  Statement up(db_, "UPDATE archives SET retrieval_status = ?, updated_at = ? WHERE id = ?");
  up.bindText(1, to_string(status)).bindInt64(2, now).bindText(3, id);
  up.run();

  json details = {{"to", to_string(status)}};
  details["from"] = cur.retrieval_status ? json(to_string(*cur.retrieval_status)) : json(nullptr);
  insertHistory(id, "RETRIEVAL_STATUS", details.dump(), now, "engine");
  tx.commit();

  auto next = std::make_shared<Snapshot>(*base);
  auto& rec = next->records.at(id);
  rec.retrieval_status = status;
  rec.updated_at = now;
  publish(std::move(next));
  return true;
}

void Ledger::insertHistory(const std::string& archive_id,
                           const std::string& event,
                           const std::string& details_json,
                           int64_t at,
                           const std::string& actor) {
  Statement st(db_, R"SQL(
    INSERT INTO archive_history (archive_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL");
  st.bindText(1, archive_id);
  st.bindText(2, event);
  st.bindText(3, details_json);
  st.bindInt64(4, at);
  st.bindText(5, actor);
  st.run();
}

std::string Ledger::snapshotJson() const {
  json arr = json::array();
  for (const auto& r : listRecords()) arr.push_back(record_to_json(r));
  return json({{"format", kLedgerSchemaVersion}, {"vault", config_.vault_name}, {"archives", arr}}).dump(2);
}

} // namespace alib
