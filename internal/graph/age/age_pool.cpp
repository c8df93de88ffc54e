#include "internal/graph/age/age_pool.hpp"

namespace twingraph::graph::age {

AgePool::AgePool(std::string conninfo, std::size_t max_connections, std::uint32_t statement_timeout_ms)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statement_timeout_ms_(statement_timeout_ms) {
}

std::shared_ptr<pqxx::connection> AgePool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      lock.unlock();

      // a connection dropped by the server is replaced rather than handed out
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      conn.reset();
      std::lock_guard relock(mutex_);
      --live_connections_;
      cv_.notify_one();
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareSession(*conn);
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

void AgePool::PrepareSession(pqxx::connection& conn) const {
  pqxx::nontransaction tx(conn);
  tx.exec("LOAD 'age'");
  tx.exec("SET search_path = ag_catalog, \"$user\", public");
  if (statement_timeout_ms_ > 0) {
    tx.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
  }
}

std::shared_ptr<pqxx::connection> AgePool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<AgePool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void AgePool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace twingraph::graph::age
