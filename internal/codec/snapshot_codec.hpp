#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/codec/serializer_registry.hpp"
#include "internal/db/model/legacy_snapshot_row.hpp"
#include "internal/model/snapshot.hpp"

namespace snapmig::codec {

struct EncodedSnapshot {
  std::string bytes;
  int32_t     serializer_id = 0;
  std::string manifest;
};

/*
  SnapshotCodec

  Legacy row -> (metadata, opaque payload), and payload -> stored form.

  Rows with a NULL snapshot_ser_id are decoded with
  `legacy_default_serializer_id`; a NULL manifest is the empty manifest.
  Every failure is a util::DeserializationError naming the row.
*/
class SnapshotCodec {
 public:
  SnapshotCodec(std::shared_ptr<const SerializerRegistry> registry, int32_t legacy_default_serializer_id);

  model::DecodedSnapshot Decode(const db::model::LegacySnapshotRow& row) const;

  EncodedSnapshot Encode(const model::SnapshotPayload& payload) const;

 private:
  std::shared_ptr<const SerializerRegistry> registry_;
  int32_t                                   legacy_default_serializer_id_;
};

} // namespace snapmig::codec
