#include "internal/codec/snapshot_codec.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace snapmig::codec {

SnapshotCodec::SnapshotCodec(std::shared_ptr<const SerializerRegistry> registry, int32_t legacy_default_serializer_id)
    : registry_(std::move(registry)), legacy_default_serializer_id_(legacy_default_serializer_id) {
  if (!registry_) {
    throw std::invalid_argument("SnapshotCodec requires a serializer registry");
  }
}

model::DecodedSnapshot SnapshotCodec::Decode(const db::model::LegacySnapshotRow& row) const {
  const int32_t      serializer_id = row.ser_id.value_or(legacy_default_serializer_id_);
  const std::string& manifest      = row.ser_manifest ? *row.ser_manifest : std::string{};

  model::DecodedSnapshot decoded;
  decoded.metadata = {row.persistence_id, row.sequence_number, row.created};

  try {
    decoded.payload = registry_->Resolve(serializer_id, manifest).Decode(row.snapshot, manifest, *registry_);
  } catch (const util::DeserializationError& e) {
    throw util::DeserializationError("snapshot " + row.persistence_id + "/" + std::to_string(row.sequence_number) +
                                     ": " + e.what());
  }
  return decoded;
}

EncodedSnapshot SnapshotCodec::Encode(const model::SnapshotPayload& payload) const {
  const auto& serializer = registry_->Resolve(payload.serializer_id, payload.manifest);
  return {serializer.Encode(payload), payload.serializer_id, payload.manifest};
}

} // namespace snapmig::codec
