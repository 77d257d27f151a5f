#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace cirrus::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + acquire_timeout_;

  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const pqxx::broken_connection& e) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw util::DependencyUnavailable(std::string("postgres: ") + e.what());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      throw util::DependencyUnavailable("postgres: timed out waiting for a connection");
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_collection",
               "SELECT id, name, access_control, password_sha256, created_at_ms "
               "FROM collection WHERE name=$1");

  conn.prepare("insert_collection",
               "INSERT INTO collection(name,access_control,password_sha256,created_at_ms) "
               "VALUES($1,$2,$3,$4) RETURNING id");

  conn.prepare("segment_owner", "SELECT object_key FROM segment WHERE collection_id=$1 AND unified_id=$2 LIMIT 1");

  conn.prepare("insert_segment",
               "INSERT INTO segment(collection_id,object_key,unified_id,conjoined_part,sequence_no,segment_offset,size,"
               "timestamp_ms,storage_location,status) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_segments",
               "SELECT collection_id,object_key,unified_id,conjoined_part,sequence_no,segment_offset,size,timestamp_ms,"
               "storage_location,status FROM segment WHERE collection_id=$1 AND unified_id=$2 "
               "ORDER BY conjoined_part, sequence_no");

  conn.prepare("update_segment_status", "UPDATE segment SET status=$4 WHERE collection_id=$1 AND unified_id=$2 AND status=$3");

  conn.prepare("insert_conjoined",
               "INSERT INTO conjoined(collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms) "
               "VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("get_conjoined",
               "SELECT collection_id,unified_id,object_key,create_ms,abort_ms,complete_ms FROM conjoined "
               "WHERE collection_id=$1 AND unified_id=$2");

  conn.prepare("update_conjoined", "UPDATE conjoined SET abort_ms=$3, complete_ms=$4 WHERE collection_id=$1 AND unified_id=$2");
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
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace cirrus::db::postgres
