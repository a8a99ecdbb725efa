#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/codec/snapshot_codec.hpp"
#include "internal/migration/cursor_store.hpp"
#include "internal/migration/entity_enumerator.hpp"
#include "internal/migration/legacy_reader.hpp"
#include "internal/migration/target_writer.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/model/state_machine.hpp"

namespace snapmig::migration {

enum class MigrationMode { kLatest, kAll, kPaged };

std::string_view ToString(MigrationMode mode);

struct MigrationSettings {
  // rows in flight at once; 1 = strictly sequential
  std::size_t parallelism    = 1;
  std::size_t queue_capacity = 64;

  uint64_t enumerate_limit = std::numeric_limits<uint64_t>::max();

  std::size_t page_size   = 1000;
  std::string cursor_name = "default";
  uint32_t    max_pages   = 0; // 0 = until exhausted
  bool        reset_cursor = false;

  uint64_t progress_log_interval = 1000; // 0 disables progress lines
};

struct MigrationReport {
  MigrationMode mode = MigrationMode::kLatest;

  uint64_t entities_enumerated       = 0;
  uint64_t entities_without_snapshot = 0;
  uint64_t snapshots_read            = 0;
  uint64_t snapshots_migrated        = 0;

  // paged mode
  uint64_t                          pages_completed = 0;
  std::optional<model::SnapshotKey> cursor;

  std::chrono::milliseconds elapsed{0};
};

/*
  MigrationOrchestrator

  Drives one migration run at a time:

    latest: enumerate ids -> newest legacy row -> decode -> replace in target
    all:    stream every legacy row -> decode -> insert (or upsert)
    paged:  keyset pages after the persisted cursor -> decode -> upsert,
            cursor committed after each complete page

  Each run executes on its own thread; the returned future yields the
  report or rethrows the first error, unchanged. The orchestrator must
  outlive every future it returned.

  State:
    Idle -> Running -> Completed | Failed
    Starting while Running throws util::InvalidState.

  Cancel() is cooperative and checked before each row is pulled; the
  run then fails with util::MigrationCancelled.
*/
class MigrationOrchestrator {
 public:
  MigrationOrchestrator(MigrationSettings                          settings,
                        std::shared_ptr<EntityEnumerator>          enumerator,
                        std::shared_ptr<LegacyReader>              reader,
                        std::shared_ptr<const codec::SnapshotCodec> codec,
                        std::shared_ptr<TargetWriter>              writer,
                        std::shared_ptr<CursorStore>               cursors);

  std::future<MigrationReport> MigrateLatest();
  std::future<MigrationReport> MigrateAll();
  std::future<MigrationReport> MigratePaged();

  void Cancel();

  model::MigrationState State() const;

 private:
  struct RunContext;

  std::future<MigrationReport> Launch(MigrationMode mode);
  MigrationReport              Run(MigrationMode mode);

  void RunLatest(RunContext& ctx);
  void RunAll(RunContext& ctx);
  void RunPaged(RunContext& ctx);

  void MigrateRow(RunContext& ctx, const db::model::LegacySnapshotRow& row, WriteMode mode);
  void CheckCancelled() const;
  void Transition(model::MigrationState to);

  MigrationSettings                           settings_;
  std::shared_ptr<EntityEnumerator>           enumerator_;
  std::shared_ptr<LegacyReader>               reader_;
  std::shared_ptr<const codec::SnapshotCodec> codec_;
  std::shared_ptr<TargetWriter>               writer_;
  std::shared_ptr<CursorStore>                cursors_;

  mutable std::mutex    mutex_;
  model::MigrationState state_ = model::MigrationState::kIdle;
  std::atomic<bool>     cancel_requested_{false};
};

} // namespace snapmig::migration
