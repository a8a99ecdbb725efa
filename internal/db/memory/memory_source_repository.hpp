#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/source_repository.hpp"

namespace snapmig::db::memory {

/*
  In-memory legacy database.

  Journal ids and legacy rows are seeded by the caller. Insertion order
  stands in for the backend row identifier when breaking "latest" ties.
  SetUnavailable() makes every call fail with util::ConnectionError, and
  FailOnTable() makes reads of one table fail with util::QueryError, as
  a missing table would.
*/
class MemorySourceRepository final : public db::SourceRepository {
public:
  MemorySourceRepository() = default;

  void AddJournalEntry(const std::string& persistence_id);
  void AddSnapshot(model::LegacySnapshotRow row);

  void SetUnavailable(bool unavailable);
  void FailOnTable(std::string table);

  // number of SelectLatest calls served
  std::size_t LatestLookups() const;

  std::unique_ptr<RowCursor<std::string>> StreamPersistenceIds(uint64_t limit) override;

  std::optional<model::LegacySnapshotRow> SelectLatest(const std::string& persistence_id) override;
  std::unique_ptr<RowCursor<model::LegacySnapshotRow>> StreamSnapshots() override;
  std::vector<model::LegacySnapshotRow> ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after,
                                                         std::size_t limit) override;

private:
  void CheckAvailable(const std::string& table) const;
  std::vector<model::LegacySnapshotRow> SortedSnapshots() const;

  mutable std::mutex mutex_;
  std::vector<std::string> journal_;
  std::vector<model::LegacySnapshotRow> snapshots_;
  bool unavailable_ = false;
  std::string failing_table_;
  std::size_t latest_lookups_ = 0;
};

}
