#pragma once

#include <optional>

namespace snapmig::db {

/*
  Forward-only, pull-based cursor over a source query.

  Rows are fetched on demand; the cursor owns the underlying statement
  (sqlite3_stmt / server-side cursor) and releases it on destruction,
  so abandoning a cursor mid-stream closes it.

  Next() returns std::nullopt once exhausted and throws
  util::ConnectionError / util::QueryError on backend failure.
*/
template <typename T>
class RowCursor {
 public:
  virtual ~RowCursor() = default;

  virtual std::optional<T> Next() = 0;
};

} // namespace snapmig::db
