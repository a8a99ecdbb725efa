#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/codec/snapshot_codec.hpp"
#include "internal/db/api/source_repository.hpp"
#include "internal/db/api/target_repository.hpp"
#include "internal/migration/migration_orchestrator.hpp"
#include "internal/store/snapshot_store.hpp"

namespace snapmig::factory {

/*
  Application

  Owns every long-lived object of one migrator process.
*/
struct Application {
  std::shared_ptr<db::SourceRepository> source;
  std::shared_ptr<db::TargetRepository> target;

  std::shared_ptr<const codec::SnapshotCodec> codec;
  std::shared_ptr<store::SnapshotStore>       store;

  std::shared_ptr<migration::MigrationOrchestrator> orchestrator;
};

migration::MigrationSettings BuildSettings(const snapmig::runtime::config::RuntimeConfig& config);

std::shared_ptr<const codec::SnapshotCodec> BuildCodec(const snapmig::runtime::config::RuntimeConfig& config);

/*
  Wires codec, store and migration components over existing
  repositories.
*/
Application Assemble(const snapmig::runtime::config::RuntimeConfig& config,
                     std::shared_ptr<db::SourceRepository>          source,
                     std::shared_ptr<db::TargetRepository>          target);

/*
  Build

  Composition root: opens the configured source and target databases
  (bootstrapping the target tables when asked) and assembles the
  pipeline. The ONLY place that knows concrete DB types.
*/
Application Build(const snapmig::runtime::config::RuntimeConfig& config);

} // namespace snapmig::factory
