#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace twingraph::graph::age {

/*
  AgePool

  Bounded connection pool used by AgeGraphStore.

  Design notes:
  -------------
  - Each statement gets its own connection for its duration.
  - libpqxx connections are NOT thread-safe, do not share.
  - Every new connection loads the AGE extension, puts ag_catalog on
    the search path and applies the statement timeout.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    AgeGraphStore owns shared_ptr<AgePool>
    callers hold shared_ptr<pqxx::connection>; releasing it returns
    the connection to the pool (or closes it once the pool is gone)
*/

class AgePool : public std::enable_shared_from_this<AgePool> {
 public:
  AgePool(std::string conninfo, std::size_t max_connections = 16, std::uint32_t statement_timeout_ms = 0);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  void                              PrepareSession(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string   conninfo_;
  std::size_t   max_connections_;
  std::uint32_t statement_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace twingraph::graph::age
