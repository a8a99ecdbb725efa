#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/source_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "pg_pool.hpp"

namespace snapmig::db::postgres {

/*
  Streams run inside a read-only transaction on a dedicated pooled
  connection through a server-side cursor (DECLARE / FETCH FORWARD), so
  only `fetch_size` rows are client-side at any time. SelectLatest and
  page reads borrow a second connection; size the pool accordingly.
*/
class PgSourceRepository final : public db::SourceRepository {
public:
  PgSourceRepository(std::shared_ptr<PgPool> pool, const sql::SourceTables& tables, std::size_t fetch_size = 500);

  std::unique_ptr<RowCursor<std::string>> StreamPersistenceIds(uint64_t limit) override;

  std::optional<model::LegacySnapshotRow> SelectLatest(const std::string& persistence_id) override;
  std::unique_ptr<RowCursor<model::LegacySnapshotRow>> StreamSnapshots() override;
  std::vector<model::LegacySnapshotRow> ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after,
                                                         std::size_t limit) override;

private:
  std::shared_ptr<PgPool> pool_;
  sql::SourceQueries queries_;
  std::size_t fetch_size_;
};

}
