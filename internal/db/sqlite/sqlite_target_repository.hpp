#pragma once

#include <memory>

#include "internal/db/api/target_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace snapmig::db::sqlite {

class SqliteTargetRepository final : public db::TargetRepository {
public:
  SqliteTargetRepository(std::shared_ptr<SqliteDB> db, const sql::TargetTables& tables);

  // CREATE TABLE IF NOT EXISTS for the snapshot and cursor tables
  void Bootstrap();

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
  std::shared_ptr<SqliteDB> db_;
  sql::TargetQueries queries_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  Result WriteSnapshot(Transaction& t, const std::string& sql, const model::SnapshotRecord& r);
  std::vector<model::SnapshotRecord> ReadSnapshots(Statement st);
};

}
