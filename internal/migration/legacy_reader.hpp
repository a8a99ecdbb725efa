#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/source_repository.hpp"

namespace snapmig::migration {

/*
  Read side of the legacy snapshot table.

  LatestFor   - newest snapshot of one entity, empty when it has none
  StreamAll   - every row, persistence_id / sequence_number / created order
  ReadPage    - keyset page of StreamAll's order, strictly after `after`
*/
class LegacyReader {
 public:
  explicit LegacyReader(std::shared_ptr<db::SourceRepository> source);

  std::optional<db::model::LegacySnapshotRow> LatestFor(const std::string& persistence_id) const;

  std::unique_ptr<db::RowCursor<db::model::LegacySnapshotRow>> StreamAll() const;

  std::vector<db::model::LegacySnapshotRow> ReadPage(const std::optional<model::SnapshotKey>& after,
                                                     std::size_t limit) const;

 private:
  std::shared_ptr<db::SourceRepository> source_;
};

} // namespace snapmig::migration
