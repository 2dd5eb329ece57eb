#include "pg_pool.hpp"

namespace pgshadow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::string application_name)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      application_name_(std::move(application_name)) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (!conn->is_open()) {
          // server closed it while idle; replace below
          --live_connections_;
          continue;
        }
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          ConfigureSession(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::unique_ptr<pqxx::connection> PgPool::OpenDedicated() const {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  ConfigureSession(*conn);
  return conn;
}

void PgPool::ConfigureSession(pqxx::connection& conn) const {
  pqxx::nontransaction tx(conn);
  tx.exec("SET application_name = " + tx.quote(application_name_));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace pgshadow::db::postgres
