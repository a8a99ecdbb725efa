#include "target_writer.hpp"

namespace snapmig::migration {

std::string_view ToString(WriteMode mode) {
  switch (mode) {
    case WriteMode::kLatest:
      return "latest";
    case WriteMode::kFull:
      return "full";
    case WriteMode::kPaged:
      return "paged";
  }
  return "unknown";
}

TargetWriter::TargetWriter(std::shared_ptr<store::SnapshotStore> store, bool full_mode_upsert)
    : store_(std::move(store)), full_mode_upsert_(full_mode_upsert) {}

void TargetWriter::Save(const model::DecodedSnapshot& snapshot, WriteMode mode) {
  switch (mode) {
    case WriteMode::kLatest:
      store_->SaveLatest(snapshot.metadata, snapshot.payload);
      return;

    case WriteMode::kFull:
      if (full_mode_upsert_) {
        store_->Upsert(snapshot.metadata, snapshot.payload);
      } else {
        store_->Insert(snapshot.metadata, snapshot.payload);
      }
      return;

    case WriteMode::kPaged:
      store_->Upsert(snapshot.metadata, snapshot.payload);
      return;
  }
}

} // namespace snapmig::migration
