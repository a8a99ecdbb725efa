#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/codec/snapshot_serializer.hpp"

namespace snapmig::codec {

/*
  Lookup table (serializer_id, manifest) -> SnapshotSerializer.

  Built once at startup and immutable afterwards, so lookups need no
  locking. A registration without a manifest matches any manifest for
  its id; an exact (id, manifest) registration takes precedence.
*/
class SerializerRegistry {
 public:
  struct Registration {
    std::shared_ptr<const SnapshotSerializer> serializer;
    std::optional<std::string>                manifest;
  };

  // throws std::invalid_argument on a null serializer or a duplicate key
  explicit SerializerRegistry(std::vector<Registration> registrations);

  const SnapshotSerializer* Find(int32_t serializer_id, const std::string& manifest) const;

  // throws util::DeserializationError when nothing is registered
  const SnapshotSerializer& Resolve(int32_t serializer_id, const std::string& manifest) const;

  std::size_t Size() const {
    return exact_.size() + any_manifest_.size();
  }

 private:
  std::map<std::pair<int32_t, std::string>, std::shared_ptr<const SnapshotSerializer>> exact_;
  std::map<int32_t, std::shared_ptr<const SnapshotSerializer>>                          any_manifest_;
};

} // namespace snapmig::codec
