#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace workgraph::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process; transactions on it are
  serialized through TransactionMutex().
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Create tables and indexes of the work item store.
  void BootstrapSchema();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace workgraph::db::sqlite
