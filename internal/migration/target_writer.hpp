#pragma once

#include <memory>
#include <string_view>

#include "internal/model/snapshot.hpp"
#include "internal/store/snapshot_store.hpp"

namespace snapmig::migration {

enum class WriteMode {
  kLatest, // replace all snapshots of the entity
  kFull,   // insert; duplicate key is a WriteError unless full_mode_upsert
  kPaged,  // upsert, so a replayed page rewrites in place
};

std::string_view ToString(WriteMode mode);

/*
  Persists decoded snapshots into the new store.

  One call = one target transaction. Failures are thrown unchanged
  (util::ConnectionError, util::WriteError, util::DeserializationError).
*/
class TargetWriter {
 public:
  TargetWriter(std::shared_ptr<store::SnapshotStore> store, bool full_mode_upsert = false);

  void Save(const model::DecodedSnapshot& snapshot, WriteMode mode);

 private:
  std::shared_ptr<store::SnapshotStore> store_;
  bool                                  full_mode_upsert_;
};

} // namespace snapmig::migration
