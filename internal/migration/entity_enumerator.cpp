#include "entity_enumerator.hpp"

#include <limits>

#include "internal/observability/logging.hpp"

namespace snapmig::migration {

EntityEnumerator::EntityEnumerator(std::shared_ptr<db::SourceRepository> source) : source_(std::move(source)) {}

std::unique_ptr<db::RowCursor<std::string>> EntityEnumerator::Enumerate(uint64_t limit) const {
  SNAPMIG_LOG_DEBUG("enumerating persistence ids",
                    {observability::BoolField("unbounded", limit == std::numeric_limits<uint64_t>::max()),
                     observability::StringField("limit", std::to_string(limit))});
  return source_->StreamPersistenceIds(limit);
}

} // namespace snapmig::migration
