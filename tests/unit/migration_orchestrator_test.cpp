#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/codec/builtin_serializers.hpp"
#include "internal/db/memory/memory_source_repository.hpp"
#include "internal/db/memory/memory_target_repository.hpp"
#include "internal/factory.hpp"
#include "internal/migration/cursor_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using snapmig::codec::kDefaultJsonSerializerId;
using snapmig::codec::kRawBytesSerializerId;
using snapmig::codec::LegacyEnvelopeSerializer;
using snapmig::db::memory::MemorySourceRepository;
using snapmig::db::memory::MemoryTargetRepository;
using snapmig::db::model::LegacySnapshotRow;
using snapmig::db::model::SnapshotRecord;
using snapmig::migration::MigrationReport;
using snapmig::model::MigrationState;
using snapmig::model::SnapshotKey;
using snapmig::runtime::config::RuntimeConfig;

struct Harness {
  std::shared_ptr<MemorySourceRepository> source = std::make_shared<MemorySourceRepository>();
  std::shared_ptr<MemoryTargetRepository> target = std::make_shared<MemoryTargetRepository>();
  RuntimeConfig                           config;

  Harness() {
    config.mutable_migration()->set_progress_log_interval(1);
  }

  snapmig::factory::Application Build() {
    return snapmig::factory::Assemble(config, source, target);
  }

  void Add(const std::string& id, int64_t seq, int64_t created = 0) {
    LegacySnapshotRow row;
    row.persistence_id  = id;
    row.sequence_number = seq;
    row.created         = created;
    row.snapshot        = id + "@" + std::to_string(seq) + "/" + std::to_string(created);
    row.ser_id          = kRawBytesSerializerId;
    row.ser_manifest    = "State";
    source->AddJournalEntry(id);
    source->AddSnapshot(std::move(row));
  }

  std::vector<SnapshotRecord> TargetRows() {
    auto tx   = target->Begin();
    auto rows = target->ListAllSnapshots(*tx);
    tx->Commit();
    return rows;
  }

  std::vector<SnapshotKey> TargetKeys() {
    std::vector<SnapshotKey> keys;
    for (const auto& r : TargetRows()) keys.push_back({r.persistence_id, r.sequence_number});
    return keys;
  }
};

template <typename E>
bool FailsWith(std::future<MigrationReport>& run) {
  try {
    (void)run.get();
  } catch (const E&) {
    return true;
  } catch (const std::exception& e) {
    std::cerr << "unexpected error: " << e.what() << "\n";
    return false;
  }
  return false;
}

std::vector<SnapshotKey> Keys(std::initializer_list<SnapshotKey> keys) {
  return keys;
}

// ------------------------------------------------------------
// latest
// ------------------------------------------------------------

void TestLatestWorkedExample() {
  Harness h;
  h.Add("A", 1);
  h.Add("A", 5);
  h.Add("B", 2);
  h.source->AddJournalEntry("C"); // events but no snapshot

  auto app = h.Build();
  assert(app.orchestrator->State() == MigrationState::kIdle);

  auto report = app.orchestrator->MigrateLatest().get();
  assert(app.orchestrator->State() == MigrationState::kCompleted);
  assert(report.entities_enumerated == 3);
  assert(report.entities_without_snapshot == 1);
  assert(report.snapshots_read == 2);
  assert(report.snapshots_migrated == 2);

  assert(h.TargetKeys() == Keys({{"A", 5}, {"B", 2}}));

  auto rows = h.TargetRows();
  assert(rows[0].payload == "A@5/0");
  assert(rows[0].ser_id == kRawBytesSerializerId);
  assert(rows[0].ser_manifest == "State");
}

void TestLatestIsIdempotent() {
  Harness h;
  h.Add("A", 1);
  h.Add("A", 2);
  h.Add("B", 9);

  auto app = h.Build();
  (void)app.orchestrator->MigrateLatest().get();
  auto first = h.TargetRows();

  auto report = app.orchestrator->MigrateLatest().get();
  assert(report.snapshots_migrated == 2);
  assert(app.orchestrator->State() == MigrationState::kCompleted);

  auto second = h.TargetRows();
  assert(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].persistence_id == second[i].persistence_id);
    assert(first[i].sequence_number == second[i].sequence_number);
    assert(first[i].payload == second[i].payload);
  }
}

void TestLatestReplacesOlderTargetRows() {
  Harness h;
  h.Add("A", 1);
  h.Add("A", 2);

  h.config.mutable_migration()->set_full_mode_upsert(true);
  auto app = h.Build();
  (void)app.orchestrator->MigrateAll().get();
  assert(h.TargetKeys().size() == 2);

  (void)app.orchestrator->MigrateLatest().get();
  assert(h.TargetKeys() == Keys({{"A", 2}}));
}

void TestLatestTieBreakOnCreated() {
  Harness h;
  h.Add("A", 3, 100);
  h.Add("A", 3, 200);
  h.Add("A", 3, 150);
  h.Add("A", 1, 999);

  auto app = h.Build();
  (void)app.orchestrator->MigrateLatest().get();

  auto rows = h.TargetRows();
  assert(rows.size() == 1);
  assert(rows[0].sequence_number == 3);
  assert(rows[0].created == 200);
  assert(rows[0].payload == "A@3/200");
}

void TestEnumerateLimitBoundsEntities() {
  Harness h;
  h.Add("A", 1);
  h.Add("B", 1);
  h.Add("C", 1);
  h.config.mutable_migration()->set_enumerate_limit(2);

  auto app    = h.Build();
  auto report = app.orchestrator->MigrateLatest().get();
  assert(report.entities_enumerated == 2);
  assert(h.TargetKeys() == Keys({{"A", 1}, {"B", 1}}));
  assert(h.source->LatestLookups() == 2);
}

void TestLegacyEnvelopeRowsAreUnwrapped() {
  Harness h;
  LegacySnapshotRow row;
  row.persistence_id  = "cart-1";
  row.sequence_number = 4;
  row.created         = 77;
  row.snapshot        = LegacyEnvelopeSerializer::Wrap({kDefaultJsonSerializerId, "Cart", R"({"items":3})"});
  h.source->AddJournalEntry("cart-1");
  h.source->AddSnapshot(row);

  auto app = h.Build();
  (void)app.orchestrator->MigrateLatest().get();

  auto rows = h.TargetRows();
  assert(rows.size() == 1);
  assert(rows[0].ser_id == kDefaultJsonSerializerId);
  assert(rows[0].ser_manifest == "Cart");
  assert(rows[0].payload == R"({"items":3})");
  assert(rows[0].created == 77);
}

// ------------------------------------------------------------
// all
// ------------------------------------------------------------

void TestFullHistoryIsComplete() {
  Harness h;
  h.Add("B", 2);
  h.Add("A", 5);
  h.Add("A", 1);
  h.Add("C", 7);

  auto app    = h.Build();
  auto report = app.orchestrator->MigrateAll().get();
  assert(report.snapshots_read == 4);
  assert(report.snapshots_migrated == 4);
  assert(h.TargetKeys() == Keys({{"A", 1}, {"A", 5}, {"B", 2}, {"C", 7}}));

  // written in full-scan order
  assert(h.target->WriteLog() == Keys({{"A", 1}, {"A", 5}, {"B", 2}, {"C", 7}}));
}

void TestStrictFullRerunFails() {
  Harness h;
  h.Add("A", 1);
  h.Add("B", 1);

  auto app = h.Build();
  (void)app.orchestrator->MigrateAll().get();

  auto rerun = app.orchestrator->MigrateAll();
  assert(FailsWith<snapmig::util::WriteError>(rerun));
  assert(app.orchestrator->State() == MigrationState::kFailed);
  assert(h.TargetKeys().size() == 2);
}

void TestUpsertFullRerunIsIdempotent() {
  Harness h;
  h.Add("A", 1);
  h.Add("B", 1);
  h.config.mutable_migration()->set_full_mode_upsert(true);

  auto app = h.Build();
  (void)app.orchestrator->MigrateAll().get();
  auto report = app.orchestrator->MigrateAll().get();
  assert(report.snapshots_migrated == 2);
  assert(h.TargetKeys() == Keys({{"A", 1}, {"B", 1}}));
}

// ------------------------------------------------------------
// failures
// ------------------------------------------------------------

void TestWriteFailureKeepsPartialProgress() {
  Harness h;
  h.Add("A", 1);
  h.Add("A", 2);
  h.Add("B", 1);
  h.Add("C", 1);
  h.target->FailWritesOf({"B", 1});

  auto app = h.Build();
  auto run = app.orchestrator->MigrateAll();
  assert(FailsWith<snapmig::util::WriteError>(run));
  assert(app.orchestrator->State() == MigrationState::kFailed);

  // rows before the failure stay, nothing after it is written
  assert(h.TargetKeys() == Keys({{"A", 1}, {"A", 2}}));
}

void TestDecodeFailureAbortsRun() {
  Harness h;
  h.Add("A", 1);

  LegacySnapshotRow bad;
  bad.persistence_id  = "B";
  bad.sequence_number = 1;
  bad.snapshot        = "???";
  bad.ser_id          = 31337;
  h.source->AddJournalEntry("B");
  h.source->AddSnapshot(bad);

  h.Add("C", 1);

  auto app = h.Build();
  auto run = app.orchestrator->MigrateLatest();
  assert(FailsWith<snapmig::util::DeserializationError>(run));
  assert(app.orchestrator->State() == MigrationState::kFailed);
  assert(h.TargetKeys() == Keys({{"A", 1}}));
}

void TestSourceErrorsSurface() {
  {
    Harness h;
    h.Add("A", 1);
    h.source->SetUnavailable(true);

    auto app = h.Build();
    auto run = app.orchestrator->MigrateLatest();
    assert(FailsWith<snapmig::util::ConnectionError>(run));
    assert(app.orchestrator->State() == MigrationState::kFailed);
  }
  {
    Harness h;
    h.Add("A", 1);
    h.source->FailOnTable("journal");

    auto app = h.Build();
    auto run = app.orchestrator->MigrateLatest();
    assert(FailsWith<snapmig::util::QueryError>(run));
  }
  {
    Harness h;
    h.Add("A", 1);
    h.source->FailOnTable("legacy_snapshot");

    auto app = h.Build();
    auto run = app.orchestrator->MigrateAll();
    assert(FailsWith<snapmig::util::QueryError>(run));
  }
}

void TestTargetUnavailable() {
  Harness h;
  h.Add("A", 1);
  h.target->SetUnavailable(true);

  auto app = h.Build();
  auto run = app.orchestrator->MigrateLatest();
  assert(FailsWith<snapmig::util::ConnectionError>(run));

  // a fresh run after the failure succeeds once the target is back
  h.target->SetUnavailable(false);
  (void)app.orchestrator->MigrateLatest().get();
  assert(app.orchestrator->State() == MigrationState::kCompleted);
  assert(h.TargetKeys() == Keys({{"A", 1}}));
}

// ------------------------------------------------------------
// run control
// ------------------------------------------------------------

/*
  Source whose full-scan cursor blocks before every row until opened,
  so a test can hold a run in the Running state.
*/
class GatedSource final : public snapmig::db::SourceRepository {
 public:
  explicit GatedSource(std::shared_ptr<MemorySourceRepository> inner) : inner_(std::move(inner)) {}

  void AwaitBlocked() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return blocked_ > 0; });
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  std::unique_ptr<snapmig::db::RowCursor<std::string>> StreamPersistenceIds(uint64_t limit) override {
    return inner_->StreamPersistenceIds(limit);
  }

  std::optional<LegacySnapshotRow> SelectLatest(const std::string& persistence_id) override {
    return inner_->SelectLatest(persistence_id);
  }

  std::unique_ptr<snapmig::db::RowCursor<LegacySnapshotRow>> StreamSnapshots() override {
    return std::make_unique<Cursor>(*this, inner_->StreamSnapshots());
  }

  std::vector<LegacySnapshotRow> ReadSnapshotPage(const std::optional<SnapshotKey>& after, std::size_t limit) override {
    return inner_->ReadSnapshotPage(after, limit);
  }

 private:
  class Cursor final : public snapmig::db::RowCursor<LegacySnapshotRow> {
   public:
    Cursor(GatedSource& gate, std::unique_ptr<snapmig::db::RowCursor<LegacySnapshotRow>> inner)
        : gate_(gate), inner_(std::move(inner)) {}

    std::optional<LegacySnapshotRow> Next() override {
      gate_.Wait();
      return inner_->Next();
    }

   private:
    GatedSource&                                               gate_;
    std::unique_ptr<snapmig::db::RowCursor<LegacySnapshotRow>> inner_;
  };

  void Wait() {
    std::unique_lock lock(mutex_);
    ++blocked_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return open_; });
  }

  std::shared_ptr<MemorySourceRepository> inner_;
  std::mutex                              mutex_;
  std::condition_variable                 cv_;
  int                                     blocked_ = 0;
  bool                                    open_    = false;
};

void TestCancelFailsTheRun() {
  Harness h;
  for (int i = 0; i < 10; ++i) h.Add("E" + std::to_string(i), 1);

  auto gated = std::make_shared<GatedSource>(h.source);
  auto app   = snapmig::factory::Assemble(h.config, gated, h.target);

  auto run = app.orchestrator->MigrateAll();
  gated->AwaitBlocked();
  assert(app.orchestrator->State() == MigrationState::kRunning);

  // a second run while Running is rejected
  bool rejected = false;
  try {
    (void)app.orchestrator->MigrateLatest();
  } catch (const snapmig::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);

  app.orchestrator->Cancel();
  gated->Open();

  assert(FailsWith<snapmig::util::MigrationCancelled>(run));
  assert(app.orchestrator->State() == MigrationState::kFailed);

  // at most the row already being pulled was written
  assert(h.TargetKeys().size() <= 1);

  // a new run may start from the terminal state
  h.config.mutable_migration()->set_full_mode_upsert(true);
  auto rerun = snapmig::factory::Assemble(h.config, h.source, h.target);
  auto report = rerun.orchestrator->MigrateAll().get();
  assert(report.snapshots_migrated == 10);
  assert(h.TargetKeys().size() == 10);

  auto again = app.orchestrator->MigrateLatest().get();
  assert(again.snapshots_migrated == 10);
  assert(app.orchestrator->State() == MigrationState::kCompleted);
}

// ------------------------------------------------------------
// parallelism
// ------------------------------------------------------------

void TestParallelFullMigrationKeepsEntityOrder() {
  Harness h;
  for (int e = 0; e < 20; ++e) {
    for (int seq = 1; seq <= 5; ++seq) h.Add("entity-" + std::to_string(e), seq);
  }
  h.config.mutable_migration()->set_parallelism(4);
  h.config.mutable_migration()->set_queue_capacity(2);

  auto app    = h.Build();
  auto report = app.orchestrator->MigrateAll().get();
  assert(report.snapshots_migrated == 100);
  assert(h.TargetKeys().size() == 100);

  std::map<std::string, int64_t> last_seq;
  for (const auto& key : h.target->WriteLog()) {
    auto it = last_seq.find(key.persistence_id);
    if (it != last_seq.end()) assert(key.sequence_number > it->second);
    last_seq[key.persistence_id] = key.sequence_number;
  }
  assert(last_seq.size() == 20);
}

void TestParallelLatestMigration() {
  Harness h;
  for (int e = 0; e < 30; ++e) {
    h.Add("entity-" + std::to_string(e), 1);
    h.Add("entity-" + std::to_string(e), 2);
  }
  h.source->AddJournalEntry("no-snapshot");
  h.config.mutable_migration()->set_parallelism(3);

  auto app    = h.Build();
  auto report = app.orchestrator->MigrateLatest().get();
  assert(report.entities_enumerated == 31);
  assert(report.entities_without_snapshot == 1);
  assert(report.snapshots_migrated == 30);

  auto keys = h.TargetKeys();
  assert(keys.size() == 30);
  for (const auto& key : keys) assert(key.sequence_number == 2);
}

void TestParallelFailureFailsTheRun() {
  Harness h;
  for (int e = 0; e < 10; ++e) {
    for (int seq = 1; seq <= 10; ++seq) h.Add("entity-" + std::to_string(e), seq);
  }
  h.target->FailWritesOf({"entity-3", 4});
  h.config.mutable_migration()->set_parallelism(3);

  auto app = h.Build();
  auto run = app.orchestrator->MigrateAll();
  assert(FailsWith<snapmig::util::WriteError>(run));
  assert(app.orchestrator->State() == MigrationState::kFailed);

  // per-entity order: nothing of entity-3 past the failing row
  for (const auto& key : h.TargetKeys()) {
    if (key.persistence_id == "entity-3") assert(key.sequence_number < 4);
  }
}

// ------------------------------------------------------------
// paged
// ------------------------------------------------------------

void TestPagedResumesAfterCursor() {
  Harness h;
  for (int seq = 1; seq <= 4; ++seq) h.Add("A", seq);
  for (int seq = 1; seq <= 3; ++seq) h.Add("B", seq);

  h.config.mutable_migration()->set_page_size(3);
  h.config.mutable_migration()->set_max_pages(1);
  h.config.mutable_migration()->set_cursor_name("test");

  auto first  = h.Build();
  auto report = first.orchestrator->MigratePaged().get();
  assert(report.pages_completed == 1);
  assert(report.snapshots_migrated == 3);
  assert(report.cursor.has_value());
  assert(*report.cursor == (SnapshotKey{"A", 3}));
  assert(h.TargetKeys() == Keys({{"A", 1}, {"A", 2}, {"A", 3}}));

  snapmig::migration::CursorStore cursors(h.target);
  auto saved = cursors.Load("test");
  assert(saved.has_value());
  assert(saved->last_persistence_id == "A");
  assert(saved->last_sequence_number == 3);
  assert(saved->rows_migrated == 3);

  h.config.mutable_migration()->set_max_pages(0);
  auto rest = h.Build();
  report    = rest.orchestrator->MigratePaged().get();
  assert(report.pages_completed == 2);
  assert(report.snapshots_migrated == 4);
  assert(*report.cursor == (SnapshotKey{"B", 3}));
  assert(h.TargetKeys().size() == 7);
  assert(cursors.Load("test")->rows_migrated == 7);

  // exhausted: nothing left after the cursor
  report = rest.orchestrator->MigratePaged().get();
  assert(report.pages_completed == 0);
  assert(report.snapshots_migrated == 0);
  assert(*report.cursor == (SnapshotKey{"B", 3}));
}

void TestPagedExactMultipleAndReset() {
  Harness h;
  for (int seq = 1; seq <= 6; ++seq) h.Add("A", seq);
  h.config.mutable_migration()->set_page_size(3);

  auto app    = h.Build();
  auto report = app.orchestrator->MigratePaged().get();
  assert(report.pages_completed == 2);
  assert(report.snapshots_migrated == 6);

  h.config.mutable_migration()->set_reset_cursor(true);
  auto again = h.Build();
  report     = again.orchestrator->MigratePaged().get();
  assert(report.snapshots_migrated == 6);
  assert(h.TargetKeys().size() == 6);

  snapmig::migration::CursorStore cursors(h.target);
  assert(cursors.Load("default")->rows_migrated == 6);
}

void TestPagedFailureDoesNotAdvanceCursor() {
  Harness h;
  for (int seq = 1; seq <= 9; ++seq) h.Add("A", seq);
  h.target->FailWritesOf({"A", 5});
  h.config.mutable_migration()->set_page_size(3);

  auto app = h.Build();
  auto run = app.orchestrator->MigratePaged();
  assert(FailsWith<snapmig::util::WriteError>(run));
  assert(app.orchestrator->State() == MigrationState::kFailed);

  snapmig::migration::CursorStore cursors(h.target);
  auto saved = cursors.Load("default");
  assert(saved.has_value());
  assert(saved->last_sequence_number == 3);

  // row 4 of the failed page was written and is rewritten on resume
  assert(h.TargetKeys() == Keys({{"A", 1}, {"A", 2}, {"A", 3}, {"A", 4}}));

}

void TestPagedParallel() {
  Harness h;
  for (int e = 0; e < 6; ++e) {
    for (int seq = 1; seq <= 4; ++seq) h.Add("entity-" + std::to_string(e), seq);
  }
  h.config.mutable_migration()->set_page_size(5);
  h.config.mutable_migration()->set_parallelism(3);

  auto app    = h.Build();
  auto report = app.orchestrator->MigratePaged().get();
  assert(report.snapshots_migrated == 24);
  assert(report.pages_completed == 5);
  assert(h.TargetKeys().size() == 24);
}

} // namespace

int main() {
  TestLatestWorkedExample();
  TestLatestIsIdempotent();
  TestLatestReplacesOlderTargetRows();
  TestLatestTieBreakOnCreated();
  TestEnumerateLimitBoundsEntities();
  TestLegacyEnvelopeRowsAreUnwrapped();
  TestFullHistoryIsComplete();
  TestStrictFullRerunFails();
  TestUpsertFullRerunIsIdempotent();
  TestWriteFailureKeepsPartialProgress();
  TestDecodeFailureAbortsRun();
  TestSourceErrorsSurface();
  TestTargetUnavailable();
  TestCancelFailsTheRun();
  TestParallelFullMigrationKeepsEntityOrder();
  TestParallelLatestMigration();
  TestParallelFailureFailsTheRun();
  TestPagedResumesAfterCursor();
  TestPagedExactMultipleAndReset();
  TestPagedFailureDoesNotAdvanceCursor();
  TestPagedParallel();

  std::cout << "snapshot_migrator_unit_migration_orchestrator: pass\n";
  return 0;
}
