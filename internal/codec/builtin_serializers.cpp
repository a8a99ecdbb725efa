#include "internal/codec/builtin_serializers.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <memory>

#include "internal/util/errors.hpp"
#include "snapmig/codec/v1/envelope.pb.h"

namespace snapmig::codec {

// ------------------------------------------------------------------
// bytes
// ------------------------------------------------------------------

model::SnapshotPayload RawBytesSerializer::Decode(const std::string& bytes, const std::string& manifest,
                                                  const SerializerRegistry&) const {
  return {Id(), manifest, bytes};
}

std::string RawBytesSerializer::Encode(const model::SnapshotPayload& payload) const {
  return payload.bytes;
}

// ------------------------------------------------------------------
// legacy envelope
// ------------------------------------------------------------------

namespace {

snapmig::codec::v1::LegacySnapshotEnvelope ParseEnvelope(const std::string& bytes) {
  snapmig::codec::v1::LegacySnapshotEnvelope envelope;
  if (!envelope.ParseFromString(bytes)) {
    throw util::DeserializationError("legacy envelope: malformed protobuf");
  }
  if (envelope.serializer_id() == 0) {
    throw util::DeserializationError("legacy envelope: missing serializer id");
  }
  if (envelope.serializer_id() == kLegacyEnvelopeSerializerId) {
    throw util::DeserializationError("legacy envelope: nested envelope");
  }
  return envelope;
}

} // namespace

model::SnapshotPayload LegacyEnvelopeSerializer::Decode(const std::string& bytes, const std::string&,
                                                        const SerializerRegistry& registry) const {
  auto envelope = ParseEnvelope(bytes);
  const auto& inner = registry.Resolve(envelope.serializer_id(), envelope.manifest());
  return inner.Decode(envelope.payload(), envelope.manifest(), registry);
}

std::string LegacyEnvelopeSerializer::Encode(const model::SnapshotPayload& payload) const {
  ParseEnvelope(payload.bytes);
  return payload.bytes;
}

std::string LegacyEnvelopeSerializer::Wrap(const model::SnapshotPayload& inner) {
  snapmig::codec::v1::LegacySnapshotEnvelope envelope;
  envelope.set_serializer_id(inner.serializer_id);
  envelope.set_manifest(inner.manifest);
  envelope.set_payload(inner.bytes);

  std::string out;
  if (!envelope.SerializeToString(&out)) {
    throw util::DeserializationError("legacy envelope: serialization failed");
  }
  return out;
}

// ------------------------------------------------------------------
// json
// ------------------------------------------------------------------

void JsonSerializer::Validate(const std::string& bytes) const {
  google::protobuf::Struct parsed;
  auto status = google::protobuf::util::JsonStringToMessage(bytes, &parsed);
  if (!status.ok()) {
    throw util::DeserializationError("json: " + std::string(status.message()));
  }
}

model::SnapshotPayload JsonSerializer::Decode(const std::string& bytes, const std::string& manifest,
                                              const SerializerRegistry&) const {
  Validate(bytes);
  return {Id(), manifest, bytes};
}

std::string JsonSerializer::Encode(const model::SnapshotPayload& payload) const {
  Validate(payload.bytes);
  return payload.bytes;
}

std::vector<SerializerRegistry::Registration> BuiltinSerializers(int32_t json_serializer_id) {
  std::vector<SerializerRegistry::Registration> out;
  out.push_back({std::make_shared<RawBytesSerializer>(), std::nullopt});
  out.push_back({std::make_shared<LegacyEnvelopeSerializer>(), std::nullopt});
  out.push_back({std::make_shared<JsonSerializer>(json_serializer_id), std::nullopt});
  return out;
}

} // namespace snapmig::codec
