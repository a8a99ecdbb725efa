#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace snapmig::db::model {

/*
  One row of the legacy snapshot table.

  Read-only: the migrator never mutates or deletes source rows.
  `snapshot` holds the raw serialized bytes exactly as stored.
*/

struct LegacySnapshotRow {
  std::string persistence_id;

  int64_t sequence_number = 0;

  // epoch ms
  int64_t created = 0;

  std::string snapshot;

  std::optional<int32_t>     ser_id;
  std::optional<std::string> ser_manifest;
};

// snapshot_ser_id as stored; a value outside int32 cannot name a serializer.
inline int32_t SerializerIdFromColumn(int64_t stored, const LegacySnapshotRow& row) {
  if (stored < std::numeric_limits<int32_t>::min() || stored > std::numeric_limits<int32_t>::max()) {
    throw util::DeserializationError("snapshot_ser_id " + std::to_string(stored) + " of " + row.persistence_id + "/" +
                                     std::to_string(row.sequence_number) + " is not a serializer id");
  }
  return static_cast<int32_t>(stored);
}

} // namespace snapmig::db::model
