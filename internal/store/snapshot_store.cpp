#include "internal/store/snapshot_store.hpp"

namespace snapmig::store {

SnapshotStore::SnapshotStore(std::shared_ptr<db::TargetRepository> repository,
                             std::shared_ptr<const codec::SnapshotCodec> codec)
    : repository_(std::move(repository)), codec_(std::move(codec)) {}

db::model::SnapshotRecord SnapshotStore::ToRecord(const model::SnapshotMetadata& metadata,
                                                  const model::SnapshotPayload& payload) const {
  auto encoded = codec_->Encode(payload);

  db::model::SnapshotRecord r;
  r.persistence_id  = metadata.persistence_id;
  r.sequence_number = metadata.sequence_number;
  r.created         = metadata.timestamp;
  r.ser_id          = encoded.serializer_id;
  r.ser_manifest    = std::move(encoded.manifest);
  r.payload         = std::move(encoded.bytes);
  return r;
}

void SnapshotStore::SaveLatest(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload) {
  auto record = ToRecord(metadata, payload);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteSnapshots(*tx, record.persistence_id), "delete snapshots of " + record.persistence_id);
  db::ThrowIfError(repository_->InsertSnapshot(*tx, record), "insert snapshot of " + record.persistence_id);
  tx->Commit();
}

void SnapshotStore::Insert(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload) {
  auto record = ToRecord(metadata, payload);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertSnapshot(*tx, record),
                   "insert snapshot " + record.persistence_id + "/" + std::to_string(record.sequence_number));
  tx->Commit();
}

void SnapshotStore::Upsert(const model::SnapshotMetadata& metadata, const model::SnapshotPayload& payload) {
  auto record = ToRecord(metadata, payload);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertSnapshot(*tx, record),
                   "upsert snapshot " + record.persistence_id + "/" + std::to_string(record.sequence_number));
  tx->Commit();
}

} // namespace snapmig::store
