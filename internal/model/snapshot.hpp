#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace snapmig::model {

struct SnapshotMetadata {
  std::string persistence_id;
  int64_t     sequence_number = 0;

  // epoch ms
  int64_t timestamp = 0;
};

/*
  Opaque snapshot value.

  Owns the serialized bytes together with the (serializer_id, manifest)
  pair naming the scheme they were validated against. Nothing past the
  codec looks inside `bytes`.
*/
struct SnapshotPayload {
  int32_t     serializer_id = 0;
  std::string manifest;
  std::string bytes;
};

struct DecodedSnapshot {
  SnapshotMetadata metadata;
  SnapshotPayload  payload;
};

// Position in full-scan order.
struct SnapshotKey {
  std::string persistence_id;
  int64_t     sequence_number = 0;

  friend bool operator==(const SnapshotKey& a, const SnapshotKey& b) {
    return a.persistence_id == b.persistence_id && a.sequence_number == b.sequence_number;
  }

  friend bool operator<(const SnapshotKey& a, const SnapshotKey& b) {
    return std::tie(a.persistence_id, a.sequence_number) < std::tie(b.persistence_id, b.sequence_number);
  }
};

} // namespace snapmig::model
