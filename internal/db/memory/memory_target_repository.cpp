#include "memory_target_repository.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace snapmig::db::memory {

namespace {

snapmig::model::SnapshotKey KeyOf(const model::SnapshotRecord& r) {
  return {r.persistence_id, r.sequence_number};
}

} // namespace

MemoryTargetRepository::MemoryTargetRepository() = default;

void MemoryTargetRepository::SetUnavailable(bool unavailable) {
  std::scoped_lock lock(state_mutex_);
  unavailable_ = unavailable;
}

void MemoryTargetRepository::FailWritesOf(const snapmig::model::SnapshotKey& key) {
  std::scoped_lock lock(state_mutex_);
  failing_keys_.push_back(key);
}

std::vector<snapmig::model::SnapshotKey> MemoryTargetRepository::WriteLog() const {
  std::scoped_lock lock(state_mutex_);
  return committed_.write_log;
}

std::unique_ptr<db::Transaction> MemoryTargetRepository::Begin() {
  {
    std::scoped_lock lock(state_mutex_);
    if (unavailable_) throw util::ConnectionError("memory target unavailable");
  }
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryTargetRepository::CheckWritable(const model::SnapshotRecord& r) const {
  std::scoped_lock lock(state_mutex_);
  if (std::find(failing_keys_.begin(), failing_keys_.end(), KeyOf(r)) != failing_keys_.end()) {
    return Result::Err(ErrorCode::ConstraintViolation, "write rejected for " + r.persistence_id);
  }
  return Result::Ok();
}

Result MemoryTargetRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (auto check = CheckWritable(r); !check) return check;

  auto& s = TX(t).Mutable();
  if (s.snapshots.contains(KeyOf(r))) {
    return Result::Err(ErrorCode::AlreadyExists, "duplicate key " + r.persistence_id + "/" + std::to_string(r.sequence_number));
  }
  s.snapshots[KeyOf(r)] = r;
  s.write_log.push_back(KeyOf(r));
  return Result::Ok();
}

Result MemoryTargetRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (auto check = CheckWritable(r); !check) return check;

  auto& s               = TX(t).Mutable();
  s.snapshots[KeyOf(r)] = r;
  s.write_log.push_back(KeyOf(r));
  return Result::Ok();
}

Result MemoryTargetRepository::DeleteSnapshots(Transaction& t, const std::string& persistence_id) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.snapshots, [&](const auto& entry) { return entry.first.persistence_id == persistence_id; });
  return Result::Ok();
}

std::vector<model::SnapshotRecord> MemoryTargetRepository::ListSnapshots(Transaction& t, const std::string& persistence_id) {
  std::vector<model::SnapshotRecord> out;
  for (const auto& [key, record] : TX(t).View().snapshots)
    if (key.persistence_id == persistence_id) out.push_back(record);
  return out;
}

std::vector<model::SnapshotRecord> MemoryTargetRepository::ListAllSnapshots(Transaction& t) {
  std::vector<model::SnapshotRecord> out;
  for (const auto& [_, record] : TX(t).View().snapshots) out.push_back(record);
  return out;
}

std::optional<model::MigrationCursorRecord> MemoryTargetRepository::GetCursor(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.cursors.find(name);
  if (it == s.cursors.end()) return std::nullopt;
  return it->second;
}

Result MemoryTargetRepository::UpsertCursor(Transaction& t, const model::MigrationCursorRecord& r) {
  TX(t).Mutable().cursors[r.name] = r;
  return Result::Ok();
}

Result MemoryTargetRepository::DeleteCursor(Transaction& t, const std::string& name) {
  TX(t).Mutable().cursors.erase(name);
  return Result::Ok();
}

} // namespace snapmig::db::memory
