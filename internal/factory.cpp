#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/codec/builtin_serializers.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/migration/cursor_store.hpp"
#include "internal/migration/entity_enumerator.hpp"
#include "internal/migration/legacy_reader.hpp"
#include "internal/migration/target_writer.hpp"
#include "internal/observability/logging.hpp"
#if SNAPMIG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_source_repository.hpp"
#include "internal/db/sqlite/sqlite_target_repository.hpp"
#endif
#if SNAPMIG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_source_repository.hpp"
#include "internal/db/postgres/pg_target_repository.hpp"
#endif

namespace snapmig::factory {

using observability::BoolField;
using observability::StringField;

namespace {

db::sql::SourceTables SourceTablesFrom(const snapmig::runtime::config::SourceSchemaConfig& schema) {
  db::sql::SourceTables tables;
  tables.schema_name = schema.schema_name();
  if (!schema.journal_table().empty()) tables.journal_table = schema.journal_table();
  if (!schema.legacy_snapshot_table().empty()) tables.legacy_snapshot_table = schema.legacy_snapshot_table();
  return tables;
}

db::sql::TargetTables TargetTablesFrom(const snapmig::runtime::config::TargetSchemaConfig& schema) {
  db::sql::TargetTables tables;
  tables.schema_name = schema.schema_name();
  if (!schema.snapshot_table().empty()) tables.snapshot_table = schema.snapshot_table();
  if (!schema.cursor_table().empty()) tables.cursor_table = schema.cursor_table();
  return tables;
}

#if SNAPMIG_DB_SQLITE
db::sqlite::SqliteOptions SqliteOptionsFrom(const snapmig::runtime::config::SqliteConfig& sqlite, bool read_only) {
  db::sqlite::SqliteOptions options;
  options.read_only = read_only;
  options.wal_mode  = sqlite.wal_mode();
  if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = sqlite.busy_timeout_ms();
  return options;
}
#endif

#if SNAPMIG_DB_POSTGRES
std::shared_ptr<db::postgres::PgPool> PoolFrom(const snapmig::runtime::config::PostgresConfig& postgres) {
  const std::size_t pool_size = postgres.pool_size() > 0 ? postgres.pool_size() : 4;
  return std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), pool_size);
}
#endif

std::shared_ptr<db::SourceRepository> BuildSource(const snapmig::runtime::config::RuntimeConfig& config) {
  const auto& database = config.source();
  const auto  tables   = SourceTablesFrom(config.source_schema());

  if (database.has_sqlite()) {
#if SNAPMIG_DB_SQLITE
    auto sqlite_db =
        std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), SqliteOptionsFrom(database.sqlite(), true));
    SNAPMIG_LOG_INFO("source database opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteSourceRepository>(std::move(sqlite_db), tables);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SNAPMIG_DB_POSTGRES
    SNAPMIG_LOG_INFO("source database configured", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgSourceRepository>(PoolFrom(database.postgres()), tables);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no source database configured");
}

std::shared_ptr<db::TargetRepository> BuildTarget(const snapmig::runtime::config::RuntimeConfig& config) {
  const auto& database  = config.target();
  const auto  tables    = TargetTablesFrom(config.target_schema());
  const bool  bootstrap = config.target_schema().bootstrap();

  if (database.has_sqlite()) {
#if SNAPMIG_DB_SQLITE
    auto sqlite_db =
        std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), SqliteOptionsFrom(database.sqlite(), false));
    auto repository = std::make_shared<db::sqlite::SqliteTargetRepository>(std::move(sqlite_db), tables);
    if (bootstrap) repository->Bootstrap();
    SNAPMIG_LOG_INFO("target database opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path()),
                                                BoolField("bootstrap", bootstrap)});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SNAPMIG_DB_POSTGRES
    auto repository = std::make_shared<db::postgres::PgTargetRepository>(PoolFrom(database.postgres()), tables);
    if (bootstrap) repository->Bootstrap();
    SNAPMIG_LOG_INFO("target database configured", {StringField("backend", "postgres"), BoolField("bootstrap", bootstrap)});
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no target database configured");
}

} // namespace

migration::MigrationSettings BuildSettings(const snapmig::runtime::config::RuntimeConfig& config) {
  const auto& m = config.migration();

  migration::MigrationSettings settings;
  if (m.parallelism() > 0) settings.parallelism = m.parallelism();
  if (m.queue_capacity() > 0) settings.queue_capacity = m.queue_capacity();
  if (m.enumerate_limit() > 0) settings.enumerate_limit = m.enumerate_limit();
  if (m.page_size() > 0) settings.page_size = m.page_size();
  if (!m.cursor_name().empty()) settings.cursor_name = m.cursor_name();
  settings.max_pages    = m.max_pages();
  settings.reset_cursor = m.reset_cursor();
  if (m.progress_log_interval() > 0) settings.progress_log_interval = m.progress_log_interval();
  return settings;
}

std::shared_ptr<const codec::SnapshotCodec> BuildCodec(const snapmig::runtime::config::RuntimeConfig& config) {
  const auto& c = config.codec();

  const int32_t json_id    = c.json_serializer_id() != 0 ? c.json_serializer_id() : codec::kDefaultJsonSerializerId;
  const int32_t default_id = c.legacy_default_serializer_id() != 0 ? c.legacy_default_serializer_id()
                                                                   : codec::kLegacyEnvelopeSerializerId;

  auto registry = std::make_shared<codec::SerializerRegistry>(codec::BuiltinSerializers(json_id));
  return std::make_shared<codec::SnapshotCodec>(std::move(registry), default_id);
}

Application Assemble(const snapmig::runtime::config::RuntimeConfig& config,
                     std::shared_ptr<db::SourceRepository>          source,
                     std::shared_ptr<db::TargetRepository>          target) {
  Application app;
  app.source = std::move(source);
  app.target = std::move(target);

  // ------------------------------------------------------------------
  // Codec + store
  // ------------------------------------------------------------------
  app.codec = BuildCodec(config);
  app.store = std::make_shared<store::SnapshotStore>(app.target, app.codec);

  // ------------------------------------------------------------------
  // Pipeline components
  // ------------------------------------------------------------------
  auto enumerator = std::make_shared<migration::EntityEnumerator>(app.source);
  auto reader     = std::make_shared<migration::LegacyReader>(app.source);
  auto writer     = std::make_shared<migration::TargetWriter>(app.store, config.migration().full_mode_upsert());
  auto cursors    = std::make_shared<migration::CursorStore>(app.target);

  app.orchestrator = std::make_shared<migration::MigrationOrchestrator>(BuildSettings(config), std::move(enumerator),
                                                                        std::move(reader), app.codec, std::move(writer),
                                                                        std::move(cursors));
  return app;
}

Application Build(const snapmig::runtime::config::RuntimeConfig& config) {
  snapmig::config::ConfigLoader::Validate(config);

  auto source = BuildSource(config);
  auto target = BuildTarget(config);
  return Assemble(config, std::move(source), std::move(target));
}

} // namespace snapmig::factory
