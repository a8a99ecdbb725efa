#pragma once

#include <cstdint>

#include "internal/codec/serializer_registry.hpp"
#include "internal/codec/snapshot_serializer.hpp"

namespace snapmig::codec {

inline constexpr int32_t kRawBytesSerializerId       = 4;
inline constexpr int32_t kLegacyEnvelopeSerializerId = 8;
inline constexpr int32_t kDefaultJsonSerializerId    = 40;

// Opaque bytes, accepted as-is.
class RawBytesSerializer final : public SnapshotSerializer {
 public:
  int32_t Id() const override {
    return kRawBytesSerializerId;
  }
  std::string_view Name() const override {
    return "bytes";
  }

  model::SnapshotPayload Decode(const std::string& bytes, const std::string& manifest,
                                const SerializerRegistry& registry) const override;
  std::string Encode(const model::SnapshotPayload& payload) const override;
};

/*
  Legacy rows written before the ser_id/manifest columns existed carry a
  LegacySnapshotEnvelope protobuf: the real serializer id, manifest and
  bytes. Decoding unwraps it and resolves the enclosed serializer; an
  envelope inside an envelope is rejected.
*/
class LegacyEnvelopeSerializer final : public SnapshotSerializer {
 public:
  int32_t Id() const override {
    return kLegacyEnvelopeSerializerId;
  }
  std::string_view Name() const override {
    return "legacy-envelope";
  }

  model::SnapshotPayload Decode(const std::string& bytes, const std::string& manifest,
                                const SerializerRegistry& registry) const override;
  std::string Encode(const model::SnapshotPayload& payload) const override;

  // Wrap an inner payload; used to produce legacy rows.
  static std::string Wrap(const model::SnapshotPayload& inner);
};

// UTF-8 JSON object, validated through google.protobuf.Struct.
class JsonSerializer final : public SnapshotSerializer {
 public:
  explicit JsonSerializer(int32_t id = kDefaultJsonSerializerId) : id_(id) {
  }

  int32_t Id() const override {
    return id_;
  }
  std::string_view Name() const override {
    return "json";
  }

  model::SnapshotPayload Decode(const std::string& bytes, const std::string& manifest,
                                const SerializerRegistry& registry) const override;
  std::string Encode(const model::SnapshotPayload& payload) const override;

 private:
  void Validate(const std::string& bytes) const;

  int32_t id_;
};

// The default registry: bytes, legacy-envelope and json under `json_serializer_id`.
std::vector<SerializerRegistry::Registration> BuiltinSerializers(int32_t json_serializer_id = kDefaultJsonSerializerId);

} // namespace snapmig::codec
