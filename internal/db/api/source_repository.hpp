#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/row_cursor.hpp"
#include "internal/db/model/legacy_snapshot_row.hpp"
#include "internal/model/snapshot.hpp"

namespace snapmig::db {

/*
  Read-only access to the legacy database.

  Every call runs against the source connection only; nothing here ever
  writes. Backend failures are raised as util::ConnectionError or
  util::QueryError, never as driver exceptions.

  Full-scan order (StreamSnapshots / ReadSnapshotPage):
    persistence_id ASC, sequence_number ASC, created ASC
*/

class SourceRepository {
 public:
  virtual ~SourceRepository() = default;

  // ---------------------------------------------------------------------
  // Journal
  // ---------------------------------------------------------------------

  // DISTINCT persistence_id, ordered, at most `limit` values.
  virtual std::unique_ptr<RowCursor<std::string>> StreamPersistenceIds(uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Legacy snapshots
  // ---------------------------------------------------------------------

  // Highest sequence_number; ties broken by newest created, then by the
  // backend's row identifier.
  virtual std::optional<model::LegacySnapshotRow> SelectLatest(const std::string& persistence_id) = 0;

  virtual std::unique_ptr<RowCursor<model::LegacySnapshotRow>> StreamSnapshots() = 0;

  // Keyset page strictly after `after` (from the start when empty).
  virtual std::vector<model::LegacySnapshotRow> ReadSnapshotPage(const std::optional<snapmig::model::SnapshotKey>& after,
                                                                 std::size_t limit) = 0;
};

} // namespace snapmig::db
