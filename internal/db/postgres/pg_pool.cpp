#include "pg_pool.hpp"

namespace catalog::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_entity",
               "INSERT INTO entities(entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
               "next_update_at,last_discovery_at,result_hash,needs_reprocessing) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("insert_final_entity",
               "INSERT INTO final_entities(entity_id,hash,stitch_ticket) VALUES($1,$2,$3)");

  conn.prepare("get_entity",
               "SELECT entity_id,entity_ref,unprocessed_entity,processed_entity,errors,"
               "next_update_at,last_discovery_at,result_hash,needs_reprocessing "
               "FROM entities WHERE entity_ref=$1");

  conn.prepare("get_final_entity", "SELECT entity_id,hash,stitch_ticket FROM final_entities WHERE entity_id=$1");

  conn.prepare("insert_reference",
               "INSERT INTO reference_edges(source_key,source_entity_ref,target_entity_ref) VALUES($1,$2,$3)");
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
  // a broken connection must not be handed out again
  if (!conn->is_open()) {
    delete conn;
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    return;
  }

  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace catalog::db::postgres
