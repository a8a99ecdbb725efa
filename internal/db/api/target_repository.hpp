#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/migration_cursor_record.hpp"
#include "internal/db/model/snapshot_record.hpp"

namespace snapmig::db {

/*
  Target (new schema) repository.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertSnapshot never overwrites: an existing
    (persistence_id, sequence_number) yields AlreadyExists /
    ConstraintViolation
*/

class TargetRepository {
 public:
  virtual ~TargetRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual Result DeleteSnapshots(Transaction&, const std::string& persistence_id) = 0;

  // ordered by sequence_number
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& persistence_id) = 0;

  // ordered by (persistence_id, sequence_number)
  virtual std::vector<model::SnapshotRecord> ListAllSnapshots(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Paged migration cursor
  // ---------------------------------------------------------------------

  virtual std::optional<model::MigrationCursorRecord> GetCursor(Transaction&, const std::string& name) = 0;

  virtual Result UpsertCursor(Transaction&, const model::MigrationCursorRecord&) = 0;

  virtual Result DeleteCursor(Transaction&, const std::string& name) = 0;
};

} // namespace snapmig::db
