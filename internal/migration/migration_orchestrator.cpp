#include "migration_orchestrator.hpp"

#include <system_error>
#include <utility>

#include "internal/migration/entity_worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace snapmig::migration {
namespace {

using observability::IntField;
using observability::StringField;

/*
  Where decoded rows go: inline on the pipeline thread when parallelism
  is 1, otherwise into the per-entity worker pool.
*/
class RowSink {
 public:
  RowSink(std::size_t parallelism, std::size_t queue_capacity, EntityWorkerPool::Handler handler)
      : handler_(std::move(handler)) {
    if (parallelism > 1) {
      pool_ = std::make_unique<EntityWorkerPool>(parallelism, queue_capacity, handler_);
    }
  }

  void Push(db::model::LegacySnapshotRow row) {
    if (pool_) {
      pool_->Submit(std::move(row));
    } else {
      handler_(row);
    }
  }

  // returns once every pushed row is written
  void Flush() {
    if (pool_) pool_->Drain();
  }

 private:
  EntityWorkerPool::Handler         handler_;
  std::unique_ptr<EntityWorkerPool> pool_;
};

} // namespace

std::string_view ToString(MigrationMode mode) {
  switch (mode) {
    case MigrationMode::kLatest:
      return "latest";
    case MigrationMode::kAll:
      return "all";
    case MigrationMode::kPaged:
      return "paged";
  }
  return "unknown";
}

struct MigrationOrchestrator::RunContext {
  explicit RunContext(MigrationMode m) : mode(m) {}

  MigrationMode mode;

  std::atomic<uint64_t> enumerated{0};
  std::atomic<uint64_t> without_snapshot{0};
  std::atomic<uint64_t> read{0};
  std::atomic<uint64_t> migrated{0};

  uint64_t                          pages = 0;
  std::optional<model::SnapshotKey> cursor;

  MigrationReport ToReport() const {
    MigrationReport report;
    report.mode                      = mode;
    report.entities_enumerated       = enumerated.load();
    report.entities_without_snapshot = without_snapshot.load();
    report.snapshots_read            = read.load();
    report.snapshots_migrated        = migrated.load();
    report.pages_completed           = pages;
    report.cursor                    = cursor;
    return report;
  }
};

MigrationOrchestrator::MigrationOrchestrator(MigrationSettings                           settings,
                                             std::shared_ptr<EntityEnumerator>           enumerator,
                                             std::shared_ptr<LegacyReader>               reader,
                                             std::shared_ptr<const codec::SnapshotCodec> codec,
                                             std::shared_ptr<TargetWriter>               writer,
                                             std::shared_ptr<CursorStore>                cursors)
    : settings_(std::move(settings)),
      enumerator_(std::move(enumerator)),
      reader_(std::move(reader)),
      codec_(std::move(codec)),
      writer_(std::move(writer)),
      cursors_(std::move(cursors)) {}

std::future<MigrationReport> MigrationOrchestrator::MigrateLatest() {
  return Launch(MigrationMode::kLatest);
}

std::future<MigrationReport> MigrationOrchestrator::MigrateAll() {
  return Launch(MigrationMode::kAll);
}

std::future<MigrationReport> MigrationOrchestrator::MigratePaged() {
  return Launch(MigrationMode::kPaged);
}

void MigrationOrchestrator::Cancel() {
  cancel_requested_ = true;
  SNAPMIG_LOG_INFO("migration cancel requested", {StringField("state", model::ToString(State()))});
}

model::MigrationState MigrationOrchestrator::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void MigrationOrchestrator::Transition(model::MigrationState to) {
  std::lock_guard lock(mutex_);
  if (!model::CanTransition(state_, to)) {
    throw util::InvalidState("invalid migration state transition " + std::string(model::ToString(state_)) + " -> " +
                             std::string(model::ToString(to)));
  }
  state_ = to;
}

std::future<MigrationReport> MigrationOrchestrator::Launch(MigrationMode mode) {
  {
    std::lock_guard lock(mutex_);
    if (!model::CanTransition(state_, model::MigrationState::kRunning)) {
      throw util::InvalidState("migration already " + std::string(model::ToString(state_)));
    }
    state_            = model::MigrationState::kRunning;
    cancel_requested_ = false;
  }

  try {
    return std::async(std::launch::async, [this, mode] { return Run(mode); });
  } catch (const std::system_error&) {
    Transition(model::MigrationState::kFailed);
    throw;
  }
}

void MigrationOrchestrator::CheckCancelled() const {
  if (cancel_requested_.load()) {
    throw util::MigrationCancelled("migration cancelled");
  }
}

MigrationReport MigrationOrchestrator::Run(MigrationMode mode) {
  const auto started = std::chrono::steady_clock::now();
  RunContext ctx(mode);

  SNAPMIG_LOG_INFO("migration started",
                   {StringField("mode", ToString(mode)), IntField("parallelism", static_cast<int64_t>(settings_.parallelism))});

  auto elapsed = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  };

  try {
    switch (mode) {
      case MigrationMode::kLatest:
        RunLatest(ctx);
        break;
      case MigrationMode::kAll:
        RunAll(ctx);
        break;
      case MigrationMode::kPaged:
        RunPaged(ctx);
        break;
    }
  } catch (const util::MigrationCancelled&) {
    Transition(model::MigrationState::kFailed);
    SNAPMIG_LOG_WARN("migration cancelled", {StringField("mode", ToString(mode)),
                                             IntField("migrated", static_cast<int64_t>(ctx.migrated.load())),
                                             IntField("elapsed_ms", elapsed().count())});
    throw;
  } catch (const std::exception& e) {
    Transition(model::MigrationState::kFailed);
    SNAPMIG_LOG_ERROR("migration failed", {StringField("mode", ToString(mode)), StringField("error", e.what()),
                                           IntField("migrated", static_cast<int64_t>(ctx.migrated.load())),
                                           IntField("elapsed_ms", elapsed().count())});
    throw;
  }

  auto report    = ctx.ToReport();
  report.elapsed = elapsed();

  Transition(model::MigrationState::kCompleted);
  SNAPMIG_LOG_INFO("migration completed",
                   {StringField("mode", ToString(mode)),
                    IntField("entities", static_cast<int64_t>(report.entities_enumerated)),
                    IntField("without_snapshot", static_cast<int64_t>(report.entities_without_snapshot)),
                    IntField("read", static_cast<int64_t>(report.snapshots_read)),
                    IntField("migrated", static_cast<int64_t>(report.snapshots_migrated)),
                    IntField("pages", static_cast<int64_t>(report.pages_completed)),
                    IntField("elapsed_ms", report.elapsed.count())});
  return report;
}

void MigrationOrchestrator::MigrateRow(RunContext& ctx, const db::model::LegacySnapshotRow& row, WriteMode mode) {
  try {
    auto snapshot = codec_->Decode(row);

    SNAPMIG_LOG_DEBUG("migrating snapshot", {StringField("persistence_id", row.persistence_id),
                                             IntField("sequence_number", row.sequence_number),
                                             IntField("serializer_id", snapshot.payload.serializer_id),
                                             StringField("write_mode", ToString(mode))});

    writer_->Save(snapshot, mode);
  } catch (const std::exception& e) {
    SNAPMIG_LOG_ERROR("snapshot migration failed", {StringField("persistence_id", row.persistence_id),
                                                    IntField("sequence_number", row.sequence_number),
                                                    StringField("error", e.what())});
    throw;
  }

  const auto migrated = ++ctx.migrated;
  if (settings_.progress_log_interval > 0 && migrated % settings_.progress_log_interval == 0) {
    SNAPMIG_LOG_INFO("migration progress", {StringField("mode", ToString(ctx.mode)),
                                            IntField("migrated", static_cast<int64_t>(migrated)),
                                            IntField("read", static_cast<int64_t>(ctx.read.load()))});
  }
}

// ------------------------------------------------------------
// latest
// ------------------------------------------------------------

void MigrationOrchestrator::RunLatest(RunContext& ctx) {
  RowSink sink(settings_.parallelism, settings_.queue_capacity,
               [this, &ctx](const db::model::LegacySnapshotRow& row) { MigrateRow(ctx, row, WriteMode::kLatest); });

  auto ids = enumerator_->Enumerate(settings_.enumerate_limit);
  for (;;) {
    CheckCancelled();

    auto id = ids->Next();
    if (!id) break;
    ++ctx.enumerated;

    auto row = reader_->LatestFor(*id);
    if (!row) {
      ++ctx.without_snapshot;
      SNAPMIG_LOG_DEBUG("entity has no snapshot", {StringField("persistence_id", *id)});
      continue;
    }

    ++ctx.read;
    sink.Push(std::move(*row));
  }

  sink.Flush();
}

// ------------------------------------------------------------
// all
// ------------------------------------------------------------

void MigrationOrchestrator::RunAll(RunContext& ctx) {
  RowSink sink(settings_.parallelism, settings_.queue_capacity,
               [this, &ctx](const db::model::LegacySnapshotRow& row) { MigrateRow(ctx, row, WriteMode::kFull); });

  auto rows = reader_->StreamAll();
  for (;;) {
    CheckCancelled();

    auto row = rows->Next();
    if (!row) break;

    ++ctx.read;
    sink.Push(std::move(*row));
  }

  sink.Flush();
}

// ------------------------------------------------------------
// paged
// ------------------------------------------------------------

void MigrationOrchestrator::RunPaged(RunContext& ctx) {
  const auto& name = settings_.cursor_name;

  if (settings_.reset_cursor) {
    cursors_->Reset(name);
    SNAPMIG_LOG_INFO("migration cursor reset", {StringField("cursor", name)});
  }

  std::optional<model::SnapshotKey> after;
  uint64_t                          rows_total = 0;

  if (auto saved = cursors_->Load(name)) {
    after      = model::SnapshotKey{saved->last_persistence_id, saved->last_sequence_number};
    rows_total = saved->rows_migrated;
    SNAPMIG_LOG_INFO("resuming paged migration", {StringField("cursor", name),
                                                  StringField("after_persistence_id", after->persistence_id),
                                                  IntField("after_sequence_number", after->sequence_number),
                                                  IntField("rows_migrated", static_cast<int64_t>(rows_total))});
  }
  ctx.cursor = after;

  RowSink sink(settings_.parallelism, settings_.queue_capacity,
               [this, &ctx](const db::model::LegacySnapshotRow& row) { MigrateRow(ctx, row, WriteMode::kPaged); });

  while (settings_.max_pages == 0 || ctx.pages < settings_.max_pages) {
    CheckCancelled();

    auto page = reader_->ReadPage(after, settings_.page_size);
    if (page.empty()) break;

    const bool last_page = page.size() < settings_.page_size;
    model::SnapshotKey last{page.back().persistence_id, page.back().sequence_number};

    for (auto& row : page) {
      CheckCancelled();
      ++ctx.read;
      sink.Push(std::move(row));
    }
    sink.Flush();

    rows_total += page.size();

    db::model::MigrationCursorRecord cursor;
    cursor.name                 = name;
    cursor.last_persistence_id  = last.persistence_id;
    cursor.last_sequence_number = last.sequence_number;
    cursor.rows_migrated        = rows_total;
    cursor.updated_at_ms        = util::NowMillis();
    cursors_->Save(cursor);

    after      = last;
    ctx.cursor = last;
    ++ctx.pages;

    SNAPMIG_LOG_DEBUG("page migrated", {StringField("cursor", name), IntField("page", static_cast<int64_t>(ctx.pages)),
                                        IntField("rows", static_cast<int64_t>(page.size()))});

    if (last_page) break;
  }
}

} // namespace snapmig::migration
