#include "pg_pool.hpp"

namespace flowcheck::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("list_tasks",
               "SELECT id,title,status,priority,project_id,sprint_id,owner,created_at,updated_at,"
               "completed_at,deleted_at,depends_on,blocks,assignees,audit_tag,correlation_hint "
               "FROM tasks WHERE ($1 = '' OR sprint_id = $1) AND ($2 = '' OR project_id = $2) "
               "ORDER BY id");

  conn.prepare("list_sprints",
               "SELECT id,name,status,project_id,created_at,updated_at,completed_at FROM sprints "
               "WHERE ($1 = '' OR id = $1) AND ($2 = '' OR project_id = $2) ORDER BY id");

  conn.prepare("list_projects",
               "SELECT id,name,status,created_at,updated_at,completed_at FROM projects "
               "WHERE ($1 = '' OR id = $1) ORDER BY id");
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

} // namespace flowcheck::db::postgres
