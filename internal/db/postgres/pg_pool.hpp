#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace relaystore::db::postgres {

/*
  PgPool

  Bounded set of connections, one per open transaction scope. The tag
  backfill keeps a read cursor and a writer open together, so the pool
  never holds fewer than kMinConnections.

  Connections return to the pool when the last shared_ptr drops; closed
  ones are discarded.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  static constexpr std::size_t kDefaultMaxConnections = 4;
  static constexpr std::size_t kMinConnections        = 2;

  explicit PgPool(std::string conninfo, std::size_t max_connections = kDefaultMaxConnections);

  // Blocks while every connection is checked out. Throws util::DatabaseError if connecting fails.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  pqxx::connection*                 Open();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace relaystore::db::postgres
