#include "internal/codec/serializer_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace snapmig::codec {

SerializerRegistry::SerializerRegistry(std::vector<Registration> registrations) {
  for (auto& registration : registrations) {
    if (!registration.serializer) {
      throw std::invalid_argument("serializer registration without serializer");
    }

    const auto id = registration.serializer->Id();
    bool inserted = false;
    if (registration.manifest) {
      inserted = exact_.emplace(std::make_pair(id, *registration.manifest), registration.serializer).second;
    } else {
      inserted = any_manifest_.emplace(id, registration.serializer).second;
    }

    if (!inserted) {
      throw std::invalid_argument("duplicate serializer registration for id " + std::to_string(id));
    }
  }
}

const SnapshotSerializer* SerializerRegistry::Find(int32_t serializer_id, const std::string& manifest) const {
  if (auto it = exact_.find({serializer_id, manifest}); it != exact_.end()) {
    return it->second.get();
  }
  if (auto it = any_manifest_.find(serializer_id); it != any_manifest_.end()) {
    return it->second.get();
  }
  return nullptr;
}

const SnapshotSerializer& SerializerRegistry::Resolve(int32_t serializer_id, const std::string& manifest) const {
  const auto* serializer = Find(serializer_id, manifest);
  if (!serializer) {
    throw util::DeserializationError("no serializer registered for id " + std::to_string(serializer_id) +
                                     (manifest.empty() ? "" : " manifest '" + manifest + "'"));
  }
  return *serializer;
}

} // namespace snapmig::codec
