#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/codec/builtin_serializers.hpp"
#include "internal/codec/serializer_registry.hpp"
#include "internal/codec/snapshot_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using snapmig::codec::BuiltinSerializers;
using snapmig::codec::JsonSerializer;
using snapmig::codec::kDefaultJsonSerializerId;
using snapmig::codec::kLegacyEnvelopeSerializerId;
using snapmig::codec::kRawBytesSerializerId;
using snapmig::codec::LegacyEnvelopeSerializer;
using snapmig::codec::RawBytesSerializer;
using snapmig::codec::SerializerRegistry;
using snapmig::codec::SnapshotCodec;
using snapmig::db::model::LegacySnapshotRow;
using snapmig::model::SnapshotPayload;
using snapmig::util::DeserializationError;

std::shared_ptr<const SerializerRegistry> DefaultRegistry() {
  return std::make_shared<SerializerRegistry>(BuiltinSerializers());
}

LegacySnapshotRow Row(std::string id, int64_t seq, std::string bytes, std::optional<int32_t> ser_id,
                      std::optional<std::string> manifest = std::nullopt) {
  LegacySnapshotRow row;
  row.persistence_id  = std::move(id);
  row.sequence_number = seq;
  row.created         = 1000 + seq;
  row.snapshot        = std::move(bytes);
  row.ser_id          = ser_id;
  row.ser_manifest    = std::move(manifest);
  return row;
}

template <typename Fn>
bool ThrowsDeserialization(Fn&& fn) {
  try {
    fn();
  } catch (const DeserializationError&) {
    return true;
  }
  return false;
}

// Tags its payloads so tests can see which registration decoded them.
class TaggingSerializer final : public snapmig::codec::SnapshotSerializer {
 public:
  TaggingSerializer(int32_t id, std::string tag) : id_(id), tag_(std::move(tag)) {}

  int32_t Id() const override {
    return id_;
  }

  std::string_view Name() const override {
    return tag_;
  }

  SnapshotPayload Decode(const std::string& bytes, const std::string& manifest, const SerializerRegistry&) const override {
    return {id_, manifest, tag_ + ":" + bytes};
  }

  std::string Encode(const SnapshotPayload& payload) const override {
    return payload.bytes;
  }

 private:
  int32_t     id_;
  std::string tag_;
};

void TestRegistryPrefersExactManifest() {
  std::vector<SerializerRegistry::Registration> registrations;
  registrations.push_back({std::make_shared<TaggingSerializer>(77, "any"), std::nullopt});
  registrations.push_back({std::make_shared<TaggingSerializer>(77, "exact"), std::string("Order")});
  SerializerRegistry registry(std::move(registrations));

  assert(registry.Size() == 2);
  assert(registry.Resolve(77, "Order").Name() == "exact");
  assert(registry.Resolve(77, "Invoice").Name() == "any");
  assert(registry.Resolve(77, "").Name() == "any");
  assert(registry.Find(78, "") == nullptr);
  assert(ThrowsDeserialization([&] { (void)registry.Resolve(78, "Order"); }));
}

void TestRegistryRejectsDuplicatesAndNull() {
  bool threw = false;
  try {
    std::vector<SerializerRegistry::Registration> registrations;
    registrations.push_back({std::make_shared<RawBytesSerializer>(), std::nullopt});
    registrations.push_back({std::make_shared<RawBytesSerializer>(), std::nullopt});
    SerializerRegistry registry(std::move(registrations));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    std::vector<SerializerRegistry::Registration> registrations;
    registrations.push_back({nullptr, std::nullopt});
    SerializerRegistry registry(std::move(registrations));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRawBytesAreOpaque() {
  SnapshotCodec codec(DefaultRegistry(), kLegacyEnvelopeSerializerId);

  const std::string binary("\x00\xff\x01payload", 10);
  auto decoded = codec.Decode(Row("A", 3, binary, kRawBytesSerializerId, "Manifest"));

  assert(decoded.metadata.persistence_id == "A");
  assert(decoded.metadata.sequence_number == 3);
  assert(decoded.metadata.timestamp == 1003);
  assert(decoded.payload.serializer_id == kRawBytesSerializerId);
  assert(decoded.payload.manifest == "Manifest");
  assert(decoded.payload.bytes == binary);

  auto encoded = codec.Encode(decoded.payload);
  assert(encoded.bytes == binary);
  assert(encoded.serializer_id == kRawBytesSerializerId);
  assert(encoded.manifest == "Manifest");
}

void TestNullSerializerIdUsesLegacyEnvelope() {
  SnapshotCodec codec(DefaultRegistry(), kLegacyEnvelopeSerializerId);

  const std::string bytes = LegacyEnvelopeSerializer::Wrap({kDefaultJsonSerializerId, "Cart", R"({"items":2})"});
  auto decoded = codec.Decode(Row("cart-1", 5, bytes, std::nullopt, std::nullopt));

  assert(decoded.payload.serializer_id == kDefaultJsonSerializerId);
  assert(decoded.payload.manifest == "Cart");
  assert(decoded.payload.bytes == R"({"items":2})");
}

void TestEnvelopeRejectsNestingAndGarbage() {
  SnapshotCodec codec(DefaultRegistry(), kLegacyEnvelopeSerializerId);

  const std::string inner  = LegacyEnvelopeSerializer::Wrap({kRawBytesSerializerId, "", "x"});
  const std::string nested = LegacyEnvelopeSerializer::Wrap({kLegacyEnvelopeSerializerId, "", inner});
  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 1, nested, kLegacyEnvelopeSerializerId)); }));

  // field 1 as a length-delimited value with a bogus length
  const std::string garbage("\x0a\xff\xff\xff", 4);
  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 2, garbage, std::nullopt)); }));

  // parses, but names no serializer
  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 3, "", std::nullopt)); }));

  // envelope pointing at an unregistered serializer
  const std::string unknown = LegacyEnvelopeSerializer::Wrap({999, "", "x"});
  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 4, unknown, std::nullopt)); }));
}

void TestJsonValidation() {
  SnapshotCodec codec(DefaultRegistry(), kLegacyEnvelopeSerializerId);

  auto ok = codec.Decode(Row("A", 1, R"({"name":"a","n":[1,2]})", kDefaultJsonSerializerId));
  assert(ok.payload.serializer_id == kDefaultJsonSerializerId);

  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 2, "{not json", kDefaultJsonSerializerId)); }));
  assert(ThrowsDeserialization([&] { (void)codec.Encode({kDefaultJsonSerializerId, "", "[1,2"}); }));
}

void TestConfigurableJsonId() {
  auto registry = std::make_shared<SerializerRegistry>(BuiltinSerializers(1001));
  SnapshotCodec codec(registry, kLegacyEnvelopeSerializerId);

  auto decoded = codec.Decode(Row("A", 1, R"({"a":1})", 1001));
  assert(decoded.payload.serializer_id == 1001);
  assert(ThrowsDeserialization([&] { (void)codec.Decode(Row("A", 1, R"({"a":1})", kDefaultJsonSerializerId)); }));
}

void TestUnknownSerializerNamesTheRow() {
  SnapshotCodec codec(DefaultRegistry(), kLegacyEnvelopeSerializerId);

  try {
    (void)codec.Decode(Row("order-9", 12, "bytes", 555));
    assert(false && "unregistered serializer must fail");
  } catch (const DeserializationError& e) {
    const std::string message = e.what();
    assert(message.find("order-9/12") != std::string::npos);
    assert(message.find("555") != std::string::npos);
  }

  assert(ThrowsDeserialization([&] { (void)codec.Encode({555, "", "bytes"}); }));
}

void TestCustomDefaultSerializer() {
  SnapshotCodec codec(DefaultRegistry(), kRawBytesSerializerId);

  auto decoded = codec.Decode(Row("A", 1, "plain", std::nullopt));
  assert(decoded.payload.serializer_id == kRawBytesSerializerId);
  assert(decoded.payload.bytes == "plain");
}

} // namespace

int main() {
  TestRegistryPrefersExactManifest();
  TestRegistryRejectsDuplicatesAndNull();
  TestRawBytesAreOpaque();
  TestNullSerializerIdUsesLegacyEnvelope();
  TestEnvelopeRejectsNestingAndGarbage();
  TestJsonValidation();
  TestConfigurableJsonId();
  TestUnknownSerializerNamesTheRow();
  TestCustomDefaultSerializer();

  std::cout << "snapshot_migrator_unit_codec: pass\n";
  return 0;
}
