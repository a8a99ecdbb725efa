#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace snapmig::db::postgres {

/*
  PgPool

  Bounded connection pool shared by one repository.

  Design notes:
  -------------
  - Each transaction / cursor gets its own connection.
  - libpqxx connections are NOT thread-safe, do not share.
  - Acquire() blocks while max_connections are checked out.
  - A connection that cannot be opened raises util::ConnectionError.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction / cursor holds shared_ptr<pqxx::connection>; the
    deleter returns it to the pool (or closes it if the pool is gone)
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace snapmig::db::postgres
