#include "sqlite_source_repository.hpp"

#include <functional>
#include <limits>

#include "sqlite_row.hpp"

namespace snapmig::db::sqlite {

namespace {

model::LegacySnapshotRow ReadLegacyRow(sqlite3_stmt* st) {
  model::LegacySnapshotRow r;
  r.persistence_id  = ColText(st, 0);
  r.sequence_number = ColI64(st, 1);
  r.created         = ColI64(st, 2);
  r.snapshot        = ColBlob(st, 3);
  r.ser_manifest    = ColOptionalText(st, 5);
  if (auto stored = ColOptionalI64(st, 4)) r.ser_id = model::SerializerIdFromColumn(*stored, r);
  return r;
}

// LIMIT -1 is "no limit" in sqlite
int64_t SqliteLimit(uint64_t limit) {
  if (limit > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return -1;
  return static_cast<int64_t>(limit);
}

/*
  Steps a prepared statement on demand. The statement is finalized when
  the cursor is destroyed, whether or not it was drained.
*/
template <typename T>
class SqliteRowCursor final : public RowCursor<T> {
 public:
  SqliteRowCursor(std::shared_ptr<SqliteDB> db, Statement stmt, std::function<T(sqlite3_stmt*)> read)
      : db_(std::move(db)), stmt_(std::move(stmt)), read_(std::move(read)) {
  }

  std::optional<T> Next() override {
    if (done_) return std::nullopt;

    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
      return read_(stmt_.get());
    }

    done_ = true;
    if (rc != SQLITE_DONE) {
      db_->ThrowError(rc, "sqlite step");
    }
    return std::nullopt;
  }

 private:
  std::shared_ptr<SqliteDB>       db_;
  Statement                       stmt_;
  std::function<T(sqlite3_stmt*)> read_;
  bool                            done_ = false;
};

} // namespace

SqliteSourceRepository::SqliteSourceRepository(std::shared_ptr<SqliteDB> db, const sql::SourceTables& tables)
    : db_(std::move(db)), queries_(sql::SourceQueries::Build(sql::Dialect::kSqlite, tables)) {}

std::unique_ptr<RowCursor<std::string>> SqliteSourceRepository::StreamPersistenceIds(uint64_t limit) {
  auto st = db_->Prepare(queries_.select_persistence_ids);
  BindI64(st.get(), 1, SqliteLimit(limit));
  return std::make_unique<SqliteRowCursor<std::string>>(db_, std::move(st),
                                                        [](sqlite3_stmt* s) { return ColText(s, 0); });
}

std::optional<model::LegacySnapshotRow> SqliteSourceRepository::SelectLatest(const std::string& persistence_id) {
  auto st = db_->Prepare(queries_.select_latest_snapshot);
  BindText(st.get(), 1, persistence_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) db_->ThrowError(rc, "sqlite select latest");

  return ReadLegacyRow(st.get());
}

std::unique_ptr<RowCursor<model::LegacySnapshotRow>> SqliteSourceRepository::StreamSnapshots() {
  auto st = db_->Prepare(queries_.select_all_snapshots);
  return std::make_unique<SqliteRowCursor<model::LegacySnapshotRow>>(db_, std::move(st), ReadLegacyRow);
}

std::vector<model::LegacySnapshotRow>
SqliteSourceRepository::ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after, std::size_t limit) {
  Statement st;
  if (after) {
    st = db_->Prepare(queries_.select_page_after);
    BindText(st.get(), 1, after->persistence_id);
    BindI64(st.get(), 2, after->sequence_number);
    BindI64(st.get(), 3, SqliteLimit(limit));
  } else {
    st = db_->Prepare(queries_.select_first_page);
    BindI64(st.get(), 1, SqliteLimit(limit));
  }

  std::vector<model::LegacySnapshotRow> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadLegacyRow(st.get()));
  }
  if (rc != SQLITE_DONE) db_->ThrowError(rc, "sqlite read page");
  return out;
}

} // namespace snapmig::db::sqlite
