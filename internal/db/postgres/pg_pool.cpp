#include "pg_pool.hpp"

namespace modstore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_module",
               "SELECT id,module_path,version,sort_version,version_type,series_path,commit_time_ms,incompatible,"
               "has_manifest,redistributable,source_info,updated_at_ms FROM modules WHERE module_path=$1 AND version=$2");

  conn.prepare("get_version_state",
               "SELECT module_path,version,sort_version,incompatible,app_version,status,error,try_count,"
               "last_processed_at_ms,next_processed_after_ms,num_packages,created_at_ms "
               "FROM module_version_states WHERE module_path=$1 AND version=$2");

  conn.prepare("advisory_xact_lock", "SELECT pg_advisory_xact_lock($1)");
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
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace modstore::db::postgres
