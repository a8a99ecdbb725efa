#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/source_repository.hpp"

namespace snapmig::migration {

/*
  Distinct persistence ids known to the legacy journal, in id order.

  Every Enumerate() call re-runs the query; the returned cursor owns it.
*/
class EntityEnumerator {
 public:
  explicit EntityEnumerator(std::shared_ptr<db::SourceRepository> source);

  std::unique_ptr<db::RowCursor<std::string>> Enumerate(uint64_t limit) const;

 private:
  std::shared_ptr<db::SourceRepository> source_;
};

} // namespace snapmig::migration
