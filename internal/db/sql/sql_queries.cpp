#include "internal/db/sql/sql_queries.hpp"

namespace snapmig::db::sql {

namespace {

constexpr const char* kLegacyColumns =
    "persistence_id,sequence_number,created,snapshot,snapshot_ser_id,snapshot_ser_manifest";

constexpr const char* kSnapshotColumns =
    "persistence_id,sequence_number,created,snapshot_ser_id,snapshot_ser_manifest,snapshot_payload";

std::string Values(Dialect dialect, int count) {
  std::string out = "VALUES(";
  for (int i = 1; i <= count; ++i) {
    if (i > 1) out += ",";
    out += Placeholder(dialect, i);
  }
  return out + ")";
}

} // namespace

std::string Placeholder(Dialect dialect, int index) {
  return (dialect == Dialect::kPostgres ? "$" : "?") + std::to_string(index);
}

std::string QualifiedName(const std::string& schema_name, const std::string& table) {
  if (schema_name.empty()) return table;
  return schema_name + "." + table;
}

SourceQueries SourceQueries::Build(Dialect dialect, const SourceTables& tables) {
  const auto journal  = QualifiedName(tables.schema_name, tables.journal_table);
  const auto snapshot = QualifiedName(tables.schema_name, tables.legacy_snapshot_table);
  const auto p        = [dialect](int i) { return Placeholder(dialect, i); };

  // final tie-break on the physical row identifier keeps both "latest"
  // and the full-scan order deterministic for duplicate rows
  const std::string row_id = dialect == Dialect::kPostgres ? "ctid" : "rowid";
  const std::string full_scan_order =
      " ORDER BY persistence_id ASC, sequence_number ASC, created ASC, " + row_id + " ASC";

  SourceQueries q;
  q.select_persistence_ids =
      "SELECT DISTINCT persistence_id FROM " + journal + " ORDER BY persistence_id ASC LIMIT " + p(1) + ";";

  q.select_latest_snapshot = std::string("SELECT ") + kLegacyColumns + " FROM " + snapshot +
                             " WHERE persistence_id=" + p(1) +
                             " ORDER BY sequence_number DESC, created DESC, " + row_id + " DESC LIMIT 1;";

  q.select_all_snapshots = std::string("SELECT ") + kLegacyColumns + " FROM " + snapshot + full_scan_order + ";";

  q.select_first_page = std::string("SELECT ") + kLegacyColumns + " FROM " + snapshot + full_scan_order +
                        " LIMIT " + p(1) + ";";

  q.select_page_after = std::string("SELECT ") + kLegacyColumns + " FROM " + snapshot +
                        " WHERE persistence_id>" + p(1) + " OR (persistence_id=" + p(1) +
                        " AND sequence_number>" + p(2) + ")" + full_scan_order + " LIMIT " + p(3) + ";";
  return q;
}

TargetQueries TargetQueries::Build(Dialect dialect, const TargetTables& tables) {
  const auto snapshot = QualifiedName(tables.schema_name, tables.snapshot_table);
  const auto cursor   = QualifiedName(tables.schema_name, tables.cursor_table);
  const auto p        = [dialect](int i) { return Placeholder(dialect, i); };

  const bool        pg      = dialect == Dialect::kPostgres;
  const std::string bigint  = pg ? "BIGINT" : "INTEGER";
  const std::string payload = pg ? "BYTEA" : "BLOB";

  TargetQueries q;
  q.create_snapshot_table = "CREATE TABLE IF NOT EXISTS " + snapshot +
                            " (persistence_id TEXT NOT NULL, sequence_number " + bigint +
                            " NOT NULL, created " + bigint +
                            " NOT NULL, snapshot_ser_id INTEGER NOT NULL, snapshot_ser_manifest TEXT NOT NULL,"
                            " snapshot_payload " + payload +
                            " NOT NULL, PRIMARY KEY (persistence_id, sequence_number));";

  q.create_cursor_table = "CREATE TABLE IF NOT EXISTS " + cursor + " (name TEXT PRIMARY KEY, last_persistence_id TEXT NOT NULL,"
                          " last_sequence_number " + bigint + " NOT NULL, rows_migrated " + bigint +
                          " NOT NULL, updated_at_ms " + bigint + " NOT NULL);";

  q.insert_snapshot = "INSERT INTO " + snapshot + "(" + kSnapshotColumns + ") " + Values(dialect, 6) + ";";

  q.upsert_snapshot = "INSERT INTO " + snapshot + "(" + kSnapshotColumns + ") " + Values(dialect, 6) +
                      " ON CONFLICT(persistence_id, sequence_number) DO UPDATE SET"
                      " created=excluded.created,"
                      " snapshot_ser_id=excluded.snapshot_ser_id,"
                      " snapshot_ser_manifest=excluded.snapshot_ser_manifest,"
                      " snapshot_payload=excluded.snapshot_payload;";

  q.delete_snapshots = "DELETE FROM " + snapshot + " WHERE persistence_id=" + p(1) + ";";

  q.select_snapshots = std::string("SELECT ") + kSnapshotColumns + " FROM " + snapshot +
                       " WHERE persistence_id=" + p(1) + " ORDER BY sequence_number ASC;";

  q.select_all_snapshots = std::string("SELECT ") + kSnapshotColumns + " FROM " + snapshot +
                           " ORDER BY persistence_id ASC, sequence_number ASC;";

  q.select_cursor = "SELECT name,last_persistence_id,last_sequence_number,rows_migrated,updated_at_ms FROM " + cursor +
                    " WHERE name=" + p(1) + ";";

  q.upsert_cursor = "INSERT INTO " + cursor +
                    "(name,last_persistence_id,last_sequence_number,rows_migrated,updated_at_ms) " + Values(dialect, 5) +
                    " ON CONFLICT(name) DO UPDATE SET"
                    " last_persistence_id=excluded.last_persistence_id,"
                    " last_sequence_number=excluded.last_sequence_number,"
                    " rows_migrated=excluded.rows_migrated,"
                    " updated_at_ms=excluded.updated_at_ms;";

  q.delete_cursor = "DELETE FROM " + cursor + " WHERE name=" + p(1) + ";";
  return q;
}

} // namespace snapmig::db::sql
