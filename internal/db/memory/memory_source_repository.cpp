#include "memory_source_repository.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include "internal/util/errors.hpp"

namespace snapmig::db::memory {

namespace {

template <typename T>
class VectorCursor final : public RowCursor<T> {
 public:
  explicit VectorCursor(std::vector<T> rows) : rows_(std::move(rows)) {}

  std::optional<T> Next() override {
    if (index_ >= rows_.size()) return std::nullopt;
    return std::move(rows_[index_++]);
  }

 private:
  std::vector<T> rows_;
  std::size_t    index_ = 0;
};

bool FullScanLess(const model::LegacySnapshotRow& a, const model::LegacySnapshotRow& b) {
  return std::tie(a.persistence_id, a.sequence_number, a.created) <
         std::tie(b.persistence_id, b.sequence_number, b.created);
}

} // namespace

void MemorySourceRepository::AddJournalEntry(const std::string& persistence_id) {
  std::lock_guard lock(mutex_);
  journal_.push_back(persistence_id);
}

void MemorySourceRepository::AddSnapshot(model::LegacySnapshotRow row) {
  std::lock_guard lock(mutex_);
  snapshots_.push_back(std::move(row));
}

void MemorySourceRepository::SetUnavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

void MemorySourceRepository::FailOnTable(std::string table) {
  std::lock_guard lock(mutex_);
  failing_table_ = std::move(table);
}

std::size_t MemorySourceRepository::LatestLookups() const {
  std::lock_guard lock(mutex_);
  return latest_lookups_;
}

void MemorySourceRepository::CheckAvailable(const std::string& table) const {
  if (unavailable_) {
    throw util::ConnectionError("memory source unavailable");
  }
  if (!failing_table_.empty() && failing_table_ == table) {
    throw util::QueryError("no such table: " + table);
  }
}

std::vector<model::LegacySnapshotRow> MemorySourceRepository::SortedSnapshots() const {
  auto rows = snapshots_;
  std::stable_sort(rows.begin(), rows.end(), FullScanLess);
  return rows;
}

std::unique_ptr<RowCursor<std::string>> MemorySourceRepository::StreamPersistenceIds(uint64_t limit) {
  std::lock_guard lock(mutex_);
  CheckAvailable("journal");

  std::set<std::string> distinct(journal_.begin(), journal_.end());

  std::vector<std::string> ids;
  for (const auto& id : distinct) {
    if (ids.size() >= limit) break;
    ids.push_back(id);
  }
  return std::make_unique<VectorCursor<std::string>>(std::move(ids));
}

std::optional<model::LegacySnapshotRow> MemorySourceRepository::SelectLatest(const std::string& persistence_id) {
  std::lock_guard lock(mutex_);
  CheckAvailable("legacy_snapshot");
  ++latest_lookups_;

  const model::LegacySnapshotRow* best = nullptr;
  for (const auto& row : snapshots_) {
    if (row.persistence_id != persistence_id) continue;
    // later insertion wins a full tie, like a higher rowid
    if (!best || std::tie(row.sequence_number, row.created) >= std::tie(best->sequence_number, best->created)) {
      best = &row;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

std::unique_ptr<RowCursor<model::LegacySnapshotRow>> MemorySourceRepository::StreamSnapshots() {
  std::lock_guard lock(mutex_);
  CheckAvailable("legacy_snapshot");
  return std::make_unique<VectorCursor<model::LegacySnapshotRow>>(SortedSnapshots());
}

std::vector<model::LegacySnapshotRow>
MemorySourceRepository::ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after, std::size_t limit) {
  std::lock_guard lock(mutex_);
  CheckAvailable("legacy_snapshot");

  std::vector<model::LegacySnapshotRow> out;
  for (auto& row : SortedSnapshots()) {
    if (out.size() >= limit) break;
    if (after && !(*after < snapmig::model::SnapshotKey{row.persistence_id, row.sequence_number})) continue;
    out.push_back(std::move(row));
  }
  return out;
}

} // namespace snapmig::db::memory
