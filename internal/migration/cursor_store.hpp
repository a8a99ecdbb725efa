#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/target_repository.hpp"

namespace snapmig::migration {

/*
  Named resume position of paged migrations, kept in the target
  database. Every call is its own transaction.
*/
class CursorStore {
 public:
  explicit CursorStore(std::shared_ptr<db::TargetRepository> repository);

  std::optional<db::model::MigrationCursorRecord> Load(const std::string& name);

  void Save(const db::model::MigrationCursorRecord& cursor);

  void Reset(const std::string& name);

 private:
  std::shared_ptr<db::TargetRepository> repository_;
};

} // namespace snapmig::migration
