#include "pg_target_repository.hpp"

#include "pg_errors.hpp"

namespace snapmig::db::postgres {

namespace {

model::SnapshotRecord ReadSnapshotRow(const pqxx::row& row) {
  auto raw = row[5].as<std::basic_string<std::byte>>();

  model::SnapshotRecord r;
  r.persistence_id  = row[0].c_str();
  r.sequence_number = row[1].as<int64_t>();
  r.created         = row[2].as<int64_t>();
  r.ser_id          = row[3].as<int32_t>();
  r.ser_manifest    = row[4].c_str();
  r.payload.assign(reinterpret_cast<const char*>(raw.data()), raw.size());
  return r;
}

} // namespace

PgTargetRepository::PgTargetRepository(std::shared_ptr<PgPool> pool, const sql::TargetTables& tables)
    : pool_(std::move(pool)), queries_(sql::TargetQueries::Build(sql::Dialect::kPostgres, tables)) {
}

void PgTargetRepository::Bootstrap() {
  auto conn = pool_->Acquire();
  try {
    pqxx::work tx(*conn);
    tx.exec(queries_.create_snapshot_table);
    tx.exec(queries_.create_cursor_table);
    tx.commit();
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres bootstrap");
  }
}

std::unique_ptr<db::Transaction> PgTargetRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgTargetRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgTargetRepository::WriteSnapshot(Transaction& t, const std::string& sql, const model::SnapshotRecord& r) {
  try {
    TX(t).Work().exec_params(sql, r.persistence_id, r.sequence_number, r.created, r.ser_id, r.ser_manifest,
                             pqxx::binary_cast(r.payload));
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateWriteError(e);
  }
}

Result PgTargetRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  return WriteSnapshot(t, queries_.insert_snapshot, r);
}

Result PgTargetRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  return WriteSnapshot(t, queries_.upsert_snapshot, r);
}

Result PgTargetRepository::DeleteSnapshots(Transaction& t, const std::string& persistence_id) {
  try {
    TX(t).Work().exec_params(queries_.delete_snapshots, persistence_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateWriteError(e);
  }
}

std::vector<model::SnapshotRecord> PgTargetRepository::ListSnapshots(Transaction& t, const std::string& persistence_id) {
  try {
    auto res = TX(t).Work().exec_params(queries_.select_snapshots, persistence_id);

    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadSnapshotRow(row));
    return out;
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres list snapshots");
  }
}

std::vector<model::SnapshotRecord> PgTargetRepository::ListAllSnapshots(Transaction& t) {
  try {
    auto res = TX(t).Work().exec(queries_.select_all_snapshots);

    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadSnapshotRow(row));
    return out;
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres list all snapshots");
  }
}

std::optional<model::MigrationCursorRecord> PgTargetRepository::GetCursor(Transaction& t, const std::string& name) {
  try {
    auto res = TX(t).Work().exec_params(queries_.select_cursor, name);
    if (res.empty()) return std::nullopt;

    model::MigrationCursorRecord r;
    r.name                 = res[0][0].c_str();
    r.last_persistence_id  = res[0][1].c_str();
    r.last_sequence_number = res[0][2].as<int64_t>();
    r.rows_migrated        = res[0][3].as<uint64_t>();
    r.updated_at_ms        = res[0][4].as<uint64_t>();
    return r;
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres select cursor");
  }
}

Result PgTargetRepository::UpsertCursor(Transaction& t, const model::MigrationCursorRecord& r) {
  try {
    TX(t).Work().exec_params(queries_.upsert_cursor, r.name, r.last_persistence_id, r.last_sequence_number,
                             static_cast<int64_t>(r.rows_migrated), static_cast<int64_t>(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateWriteError(e);
  }
}

Result PgTargetRepository::DeleteCursor(Transaction& t, const std::string& name) {
  try {
    TX(t).Work().exec_params(queries_.delete_cursor, name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateWriteError(e);
  }
}

} // namespace snapmig::db::postgres
