#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/snapshot.hpp"

namespace snapmig::codec {

class SerializerRegistry;

/*
  One decoding scheme for stored snapshot bytes.

  Decode() validates `bytes` against the scheme and returns the payload
  in its innermost scheme (an envelope resolves its enclosed serializer
  through `registry`). Encode() returns the stored form of a payload
  previously produced by Decode(). Both throw util::DeserializationError
  on malformed input.

  Implementations are stateless and shared across threads.
*/
class SnapshotSerializer {
 public:
  virtual ~SnapshotSerializer() = default;

  virtual int32_t          Id() const   = 0;
  virtual std::string_view Name() const = 0;

  virtual model::SnapshotPayload Decode(const std::string& bytes, const std::string& manifest,
                                        const SerializerRegistry& registry) const = 0;

  virtual std::string Encode(const model::SnapshotPayload& payload) const = 0;
};

} // namespace snapmig::codec
