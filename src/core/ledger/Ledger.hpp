#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/ledger/ArchiveRecord.hpp"
#include "core/ledger/Database.hpp"
#include "core/ledger/ReferenceIndex.hpp"

namespace alib {

// Authoritative store of archive records.
//
// Mutations run under the database's exclusive write transaction and publish
// a fresh immutable snapshot on commit. Reads only ever look at the last
// published snapshot, so they never wait on a writer.
class Ledger {
public:
  // Runs inside the creating transaction, before commit. Throwing aborts the
  // creation and nothing becomes visible.
  using StageFn = std::function<void(const ArchiveRecord&)>;

  Ledger(Database& db, const EngineConfig& config);

  ArchiveRecord createRecord(const RecordDraft& draft, const StageFn& beforeCommit = {});

  ArchiveRecord resolveReference(const std::string& prefix) const;
  ArchiveRecord getRecord(const std::string& id) const;
  std::optional<ArchiveRecord> findRecord(const std::string& id) const;

  // Most recent first; ties broken by identifier. limit == 0 returns all.
  std::vector<ArchiveRecord> listRecords(size_t limit = 0) const;
  size_t size() const;

  // Both return false when the status was already recorded (no-op).
  bool updateUploadStatus(const std::string& id, UploadStatus status,
                          const std::optional<std::string>& remoteArchiveId = std::nullopt);
  bool updateRetrievalStatus(const std::string& id, RetrievalStatus status);

  // JSON document of every record, for version control.
  std::string snapshotJson() const;

private:
  struct Snapshot {
    std::map<std::string, ArchiveRecord> records;
    ReferenceIndex index;
  };

  std::shared_ptr<const Snapshot> current() const;
  void publish(std::shared_ptr<const Snapshot> next);
  void load();
  std::string generateId(const RecordDraft& draft, int64_t created_at) const;
  void insertHistory(const std::string& archive_id, const std::string& event,
                     const std::string& details_json, int64_t at, const std::string& actor);

  Database& db_;
  EngineConfig config_;
  std::shared_ptr<const Snapshot> snap_;
};

} // namespace alib
