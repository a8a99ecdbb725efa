#include "legacy_reader.hpp"

namespace snapmig::migration {

LegacyReader::LegacyReader(std::shared_ptr<db::SourceRepository> source) : source_(std::move(source)) {}

std::optional<db::model::LegacySnapshotRow> LegacyReader::LatestFor(const std::string& persistence_id) const {
  return source_->SelectLatest(persistence_id);
}

std::unique_ptr<db::RowCursor<db::model::LegacySnapshotRow>> LegacyReader::StreamAll() const {
  return source_->StreamSnapshots();
}

std::vector<db::model::LegacySnapshotRow> LegacyReader::ReadPage(const std::optional<model::SnapshotKey>& after,
                                                                 std::size_t limit) const {
  if (limit == 0) {
    return {};
  }
  return source_->ReadSnapshotPage(after, limit);
}

} // namespace snapmig::migration
