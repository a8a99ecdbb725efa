#pragma once

#include <memory>

#include "internal/db/api/source_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_db.hpp"

namespace snapmig::db::sqlite {

class SqliteSourceRepository final : public db::SourceRepository {
public:
  SqliteSourceRepository(std::shared_ptr<SqliteDB> db, const sql::SourceTables& tables);

  std::unique_ptr<RowCursor<std::string>> StreamPersistenceIds(uint64_t limit) override;

  std::optional<model::LegacySnapshotRow> SelectLatest(const std::string& persistence_id) override;
  std::unique_ptr<RowCursor<model::LegacySnapshotRow>> StreamSnapshots() override;
  std::vector<model::LegacySnapshotRow> ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after,
                                                         std::size_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;
  sql::SourceQueries queries_;
};

}
