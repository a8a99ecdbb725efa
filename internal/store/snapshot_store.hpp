#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/codec/snapshot_codec.hpp"
#include "internal/db/api/target_repository.hpp"
#include "internal/model/snapshot.hpp"

namespace snapmig::store {

/*
  SnapshotStore

  Write path of the new snapshot schema: encodes a payload through the
  codec and persists it, one transaction per call.

  Errors:
    util::ConnectionError    - target unreachable
    util::WriteError         - constraint violation (duplicate key on Insert)
    util::DeserializationError - payload scheme not registered
*/
class SnapshotStore {
 public:
  SnapshotStore(std::shared_ptr<db::TargetRepository> repository, std::shared_ptr<const codec::SnapshotCodec> codec);

  // Replace every stored snapshot of the entity with this one.
  void SaveLatest(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload);

  // Add (persistence_id, sequence_number); fails if it already exists.
  void Insert(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload);

  // Add or overwrite (persistence_id, sequence_number).
  void Upsert(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload);

 private:
  db::model::SnapshotRecord ToRecord(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload) const;

  std::shared_ptr<db::TargetRepository>       repository_;
  std::shared_ptr<const codec::SnapshotCodec> codec_;
};

} // namespace snapmig::store
