#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace snapmig::db::sqlite {

namespace {

bool IsConnectionFailure(int rc) {
  switch (rc & 0xff) {
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_PERM:
    case SQLITE_READONLY:
      return true;
    default:
      return false;
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int flags = (options_.read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) |
                    SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::ConnectionError("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    // the destructor does not run for a throwing constructor
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::ThrowError(int rc, const std::string& what) const {
  std::string msg = what + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  if (IsConnectionFailure(rc)) {
    throw util::ConnectionError(msg);
  }
  throw util::QueryError(msg);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (IsConnectionFailure(rc)) {
      throw util::ConnectionError(msg);
    }
    throw util::QueryError(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    ThrowError(rc, "sqlite prepare");
  }
  return Statement(stmt);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms));
  if (rc != SQLITE_OK) ThrowError(rc, "busy_timeout");

  if (options_.read_only) {
    return;
  }

  // IMPORTANT: WAL lets the source be read while the target is written
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace snapmig::db::sqlite
