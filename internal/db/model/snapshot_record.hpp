#pragma once

#include <cstdint>
#include <string>

namespace snapmig::db::model {

/*
  Row of the new snapshot table.

  Primary key is (persistence_id, sequence_number). Latest-mode writes
  keep a single row per persistence_id.
*/

struct SnapshotRecord {
  std::string persistence_id;
  int64_t     sequence_number = 0;

  // epoch ms, copied from the legacy row
  int64_t created = 0;

  int32_t     ser_id = 0;
  std::string ser_manifest;
  std::string payload;
};

} // namespace snapmig::db::model
