#include "cursor_store.hpp"

namespace snapmig::migration {

CursorStore::CursorStore(std::shared_ptr<db::TargetRepository> repository) : repository_(std::move(repository)) {}

std::optional<db::model::MigrationCursorRecord> CursorStore::Load(const std::string& name) {
  auto tx     = repository_->Begin();
  auto cursor = repository_->GetCursor(*tx, name);
  tx->Commit();
  return cursor;
}

void CursorStore::Save(const db::model::MigrationCursorRecord& cursor) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertCursor(*tx, cursor), "save migration cursor " + cursor.name);
  tx->Commit();
}

void CursorStore::Reset(const std::string& name) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteCursor(*tx, name), "reset migration cursor " + name);
  tx->Commit();
}

} // namespace snapmig::migration
