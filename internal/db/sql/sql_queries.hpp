#pragma once

#include <string>

namespace snapmig::db::sql {

/*
  Canonical SQL for both backends.

  Table names come from configuration, so statements are assembled once
  per repository instead of living as constants. Placeholders are
  numbered in both dialects:

  Postgres: $1 $2 $3
  SQLite:   ?1 ?2 ?3
*/

enum class Dialect { kSqlite, kPostgres };

struct SourceTables {
  std::string schema_name;
  std::string journal_table         = "journal";
  std::string legacy_snapshot_table = "legacy_snapshot";
};

struct TargetTables {
  std::string schema_name;
  std::string snapshot_table = "snapshot";
  std::string cursor_table   = "snapshot_migration_cursor";
};

std::string Placeholder(Dialect dialect, int index);

std::string QualifiedName(const std::string& schema_name, const std::string& table);

struct SourceQueries {
  // $1 = limit
  std::string select_persistence_ids;
  // $1 = persistence_id
  std::string select_latest_snapshot;
  std::string select_all_snapshots;
  // $1 = limit
  std::string select_first_page;
  // $1 = persistence_id, $2 = sequence_number, $3 = limit
  std::string select_page_after;

  static SourceQueries Build(Dialect dialect, const SourceTables& tables);
};

struct TargetQueries {
  std::string create_snapshot_table;
  std::string create_cursor_table;

  // $1..$6 = persistence_id, sequence_number, created, ser_id, ser_manifest, payload
  std::string insert_snapshot;
  std::string upsert_snapshot;
  // $1 = persistence_id
  std::string delete_snapshots;
  std::string select_snapshots;
  std::string select_all_snapshots;

  // $1 = name
  std::string select_cursor;
  // $1..$5 = name, last_persistence_id, last_sequence_number, rows_migrated, updated_at_ms
  std::string upsert_cursor;
  std::string delete_cursor;

  static TargetQueries Build(Dialect dialect, const TargetTables& tables);
};

} // namespace snapmig::db::sql
