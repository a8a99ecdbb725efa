#pragma once

#include <cstdint>
#include <string>

namespace snapmig::db::model {

/*
  Persisted position of a paged migration.

  Stored in the target database so a later invocation resumes right
  after the last fully written page.
*/

struct MigrationCursorRecord {
  std::string name;

  std::string last_persistence_id;
  int64_t     last_sequence_number = 0;

  uint64_t rows_migrated = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace snapmig::db::model
