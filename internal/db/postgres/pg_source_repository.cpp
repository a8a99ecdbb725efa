#include "pg_source_repository.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <limits>

#include "pg_errors.hpp"

namespace snapmig::db::postgres {

namespace {

std::string ToBytes(const pqxx::field& f) {
  auto raw = f.as<std::basic_string<std::byte>>();
  return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

model::LegacySnapshotRow ReadLegacyRow(const pqxx::row& row) {
  model::LegacySnapshotRow r;
  try {
    r.persistence_id  = row[0].c_str();
    r.sequence_number = row[1].as<int64_t>();
    r.created         = row[2].as<int64_t>();
    r.snapshot        = ToBytes(row[3]);
    if (!row[5].is_null()) r.ser_manifest = std::string(row[5].c_str());
    if (!row[4].is_null()) r.ser_id = model::SerializerIdFromColumn(row[4].as<int64_t>(), r);
  } catch (const pqxx::conversion_error& e) {
    throw util::QueryError("postgres legacy snapshot column: " + std::string(e.what()));
  }
  return r;
}

int64_t PgLimit(uint64_t limit) {
  return static_cast<int64_t>(std::min<uint64_t>(limit, std::numeric_limits<int64_t>::max()));
}

// Cursor names only need to be unique per connection; a process-wide
// counter is simplest.
std::string NextCursorName() {
  static std::atomic<uint64_t> counter{0};
  return "snapmig_cursor_" + std::to_string(counter.fetch_add(1));
}

// DECLARE does not take bind parameters; the only parameter a streamed
// query has is a numeric LIMIT, inlined here.
std::string InlineLimit(std::string sql, int64_t limit) {
  const auto pos = sql.find("$1");
  if (pos != std::string::npos) sql.replace(pos, 2, std::to_string(limit));
  return sql;
}

std::string StripTerminator(std::string sql) {
  while (!sql.empty() && (sql.back() == ';' || sql.back() == ' ')) sql.pop_back();
  return sql;
}

template <typename T>
class PgRowCursor final : public RowCursor<T> {
 public:
  PgRowCursor(std::shared_ptr<pqxx::connection> conn, const std::string& query, std::size_t fetch_size,
              std::function<T(const pqxx::row&)> read)
      : conn_(std::move(conn)), name_(NextCursorName()), fetch_size_(fetch_size), read_(std::move(read)) {
    try {
      tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
      tx_->exec("DECLARE " + name_ + " NO SCROLL CURSOR FOR " + StripTerminator(query));
    } catch (const pqxx::failure& e) {
      ThrowReadError(e, "postgres declare cursor");
    }
  }

  ~PgRowCursor() override {
    // read_transaction aborts on destruction, which closes the cursor;
    // reset before the connection goes back to the pool
    tx_.reset();
  }

  std::optional<T> Next() override {
    if (index_ >= static_cast<std::size_t>(batch_.size())) {
      if (exhausted_) return std::nullopt;
      try {
        batch_ = tx_->exec("FETCH FORWARD " + std::to_string(fetch_size_) + " FROM " + name_);
      } catch (const pqxx::failure& e) {
        ThrowReadError(e, "postgres fetch");
      }
      index_ = 0;
      if (static_cast<std::size_t>(batch_.size()) < fetch_size_) exhausted_ = true;
      if (batch_.empty()) return std::nullopt;
    }
    return read_(batch_[static_cast<pqxx::result::size_type>(index_++)]);
  }

 private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::read_transaction> tx_;
  std::string                             name_;
  std::size_t                             fetch_size_;
  std::function<T(const pqxx::row&)>      read_;

  pqxx::result batch_;
  std::size_t  index_     = 0;
  bool         exhausted_ = false;
};

} // namespace

PgSourceRepository::PgSourceRepository(std::shared_ptr<PgPool> pool, const sql::SourceTables& tables,
                                       std::size_t fetch_size)
    : pool_(std::move(pool)),
      queries_(sql::SourceQueries::Build(sql::Dialect::kPostgres, tables)),
      fetch_size_(fetch_size == 0 ? 1 : fetch_size) {
}

std::unique_ptr<RowCursor<std::string>> PgSourceRepository::StreamPersistenceIds(uint64_t limit) {
  return std::make_unique<PgRowCursor<std::string>>(pool_->Acquire(),
                                                    InlineLimit(queries_.select_persistence_ids, PgLimit(limit)),
                                                    fetch_size_,
                                                    [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

std::optional<model::LegacySnapshotRow> PgSourceRepository::SelectLatest(const std::string& persistence_id) {
  auto conn = pool_->Acquire();
  try {
    pqxx::read_transaction tx(*conn);
    auto res = tx.exec_params(queries_.select_latest_snapshot, persistence_id);
    if (res.empty()) return std::nullopt;
    return ReadLegacyRow(res[0]);
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres select latest");
  }
}

std::unique_ptr<RowCursor<model::LegacySnapshotRow>> PgSourceRepository::StreamSnapshots() {
  return std::make_unique<PgRowCursor<model::LegacySnapshotRow>>(pool_->Acquire(), queries_.select_all_snapshots,
                                                                 fetch_size_, ReadLegacyRow);
}

std::vector<model::LegacySnapshotRow>
PgSourceRepository::ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after, std::size_t limit) {
  auto conn = pool_->Acquire();
  try {
    pqxx::read_transaction tx(*conn);
    pqxx::result res = after ? tx.exec_params(queries_.select_page_after, after->persistence_id, after->sequence_number,
                                              PgLimit(limit))
                             : tx.exec_params(queries_.select_first_page, PgLimit(limit));

    std::vector<model::LegacySnapshotRow> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadLegacyRow(row));
    }
    return out;
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres read page");
  }
}

} // namespace snapmig::db::postgres
