#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace snapmig::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

struct SqliteOptions {
  bool     read_only       = false;
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  The handle is opened FULLMUTEX; TransactionMutex() additionally
  serializes BEGIN..COMMIT spans, since SQLite transactions belong to
  the connection rather than to the calling thread.

  Open failures raise util::ConnectionError, prepare failures
  util::QueryError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Raise the util:: error matching a failed sqlite return code.
  [[noreturn]] void ThrowError(int rc, const std::string& what) const;

 private:
  // busy timeout, then WAL / synchronous pragmas for writable handles
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace snapmig::db::sqlite
