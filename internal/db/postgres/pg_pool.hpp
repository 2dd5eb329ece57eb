#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace pgshadow::db::postgres {

/*
  PgPool

  Connection factory shared by every engine of one migration.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe → do not share.
  - The backfill loop, the replay worker and the orchestrator each hold at
    most one pooled connection at a time, so max_connections >= 3 keeps
    them from starving each other.
  - The advisory lock needs a session that outlives every transaction;
    it uses OpenDedicated() and never returns to the pool.

  Lifetime:
    Engines own shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 4, std::string application_name = "pgshadow");

  // Acquire a ready-to-use pooled connection (blocks when exhausted)
  std::shared_ptr<pqxx::connection> Acquire();

  // Open a connection outside the pool's accounting
  std::unique_ptr<pqxx::connection> OpenDedicated() const;

  const std::string& conninfo() const {
    return conninfo_;
  }

 private:
  void                              ConfigureSession(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;
  std::string application_name_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace pgshadow::db::postgres
