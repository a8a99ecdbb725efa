#include "sqlite_target_repository.hpp"

#include "sqlite_row.hpp"

namespace snapmig::db::sqlite {

using snapmig::db::ErrorCode;
using snapmig::db::Result;

namespace {

Statement PrepareOrNull(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

} // namespace

SqliteTargetRepository::SqliteTargetRepository(std::shared_ptr<SqliteDB> db, const sql::TargetTables& tables)
    : db_(std::move(db)), queries_(sql::TargetQueries::Build(sql::Dialect::kSqlite, tables)) {}

void SqliteTargetRepository::Bootstrap() {
  db_->Exec(queries_.create_snapshot_table);
  db_->Exec(queries_.create_cursor_table);
}

std::unique_ptr<db::Transaction> SqliteTargetRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteTargetRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteTargetRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::ConnectionFailure, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_ERROR:
      return Result::Err(ErrorCode::QueryFailure, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteTargetRepository::WriteSnapshot(Transaction& t, const std::string& sql, const model::SnapshotRecord& r) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, sql);
  if (!st) return Result::Err(ErrorCode::QueryFailure, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.persistence_id);
  BindI64(st.get(), 2, r.sequence_number);
  BindI64(st.get(), 3, r.created);
  BindI32(st.get(), 4, r.ser_id);
  BindText(st.get(), 5, r.ser_manifest);
  BindBlob(st.get(), 6, r.payload);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteTargetRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  return WriteSnapshot(t, queries_.insert_snapshot, r);
}

Result SqliteTargetRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  return WriteSnapshot(t, queries_.upsert_snapshot, r);
}

Result SqliteTargetRepository::DeleteSnapshots(Transaction& t, const std::string& persistence_id) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, queries_.delete_snapshots);
  if (!st) return Result::Err(ErrorCode::QueryFailure, sqlite3_errmsg(db));

  BindText(st.get(), 1, persistence_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SnapshotRecord> SqliteTargetRepository::ReadSnapshots(Statement st) {
  std::vector<model::SnapshotRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::SnapshotRecord r;
    r.persistence_id  = ColText(st.get(), 0);
    r.sequence_number = ColI64(st.get(), 1);
    r.created         = ColI64(st.get(), 2);
    r.ser_id          = ColI32(st.get(), 3);
    r.ser_manifest    = ColText(st.get(), 4);
    r.payload         = ColBlob(st.get(), 5);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) db_->ThrowError(rc, "sqlite read snapshots");
  return out;
}

std::vector<model::SnapshotRecord> SqliteTargetRepository::ListSnapshots(Transaction& t, const std::string& persistence_id) {
  auto st = TX(t).DB().Prepare(queries_.select_snapshots);
  BindText(st.get(), 1, persistence_id);
  return ReadSnapshots(std::move(st));
}

std::vector<model::SnapshotRecord> SqliteTargetRepository::ListAllSnapshots(Transaction& t) {
  return ReadSnapshots(TX(t).DB().Prepare(queries_.select_all_snapshots));
}

// ------------------------------------------------------------------
// Cursor
// ------------------------------------------------------------------

std::optional<model::MigrationCursorRecord>
SqliteTargetRepository::GetCursor(Transaction& t, const std::string& name) {
  auto st = TX(t).DB().Prepare(queries_.select_cursor);
  BindText(st.get(), 1, name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) db_->ThrowError(rc, "sqlite select cursor");

  model::MigrationCursorRecord r;
  r.name                 = ColText(st.get(), 0);
  r.last_persistence_id  = ColText(st.get(), 1);
  r.last_sequence_number = ColI64(st.get(), 2);
  r.rows_migrated        = ColU64(st.get(), 3);
  r.updated_at_ms        = ColU64(st.get(), 4);
  return r;
}

Result SqliteTargetRepository::UpsertCursor(Transaction& t, const model::MigrationCursorRecord& r) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, queries_.upsert_cursor);
  if (!st) return Result::Err(ErrorCode::QueryFailure, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.last_persistence_id);
  BindI64(st.get(), 3, r.last_sequence_number);
  BindU64(st.get(), 4, r.rows_migrated);
  BindU64(st.get(), 5, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteTargetRepository::DeleteCursor(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  auto st = PrepareOrNull(db, queries_.delete_cursor);
  if (!st) return Result::Err(ErrorCode::QueryFailure, sqlite3_errmsg(db));

  BindText(st.get(), 1, name);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace snapmig::db::sqlite
