#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/target_repository.hpp"
#include "internal/model/snapshot.hpp"

namespace snapmig::db::memory {

class MemoryTransaction;

/*
  In-memory target store.

  Transactions are fully serialized (one open at a time, others block),
  which gives the same observable behavior as the sqlite backend.
  The write log records every committed snapshot write in commit order.
*/
class MemoryTargetRepository final : public db::TargetRepository {
public:
  MemoryTargetRepository();

  void SetUnavailable(bool unavailable);

  // reject writes of this key with ConstraintViolation
  void FailWritesOf(const snapmig::model::SnapshotKey& key);

  std::vector<snapmig::model::SnapshotKey> WriteLog() const;

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  Result DeleteSnapshots(Transaction&, const std::string&) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string&) override;
  std::vector<model::SnapshotRecord> ListAllSnapshots(Transaction&) override;

  std::optional<model::MigrationCursorRecord> GetCursor(Transaction&, const std::string&) override;
  Result UpsertCursor(Transaction&, const model::MigrationCursorRecord&) override;
  Result DeleteCursor(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<snapmig::model::SnapshotKey, model::SnapshotRecord> snapshots;
    std::map<std::string, model::MigrationCursorRecord> cursors;
    std::vector<snapmig::model::SnapshotKey> write_log;
  };

  Result CheckWritable(const model::SnapshotRecord& r) const;

  std::mutex tx_mutex_;
  mutable std::mutex state_mutex_;
  State committed_;

  bool unavailable_ = false;
  std::vector<snapmig::model::SnapshotKey> failing_keys_;
};

}
