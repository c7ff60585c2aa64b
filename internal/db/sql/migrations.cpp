#include "migrations.hpp"

namespace workgraph::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& WorkGraphSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS work_item (id TEXT PRIMARY KEY, title TEXT NOT NULL, status TEXT NOT NULL, priority TEXT NOT NULL, "
      "item_type TEXT NOT NULL, estimated_effort_hours REAL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      // no ON DELETE CASCADE: a referenced item must not disappear underneath its edges
      "CREATE TABLE IF NOT EXISTS work_item_edge (from_id TEXT NOT NULL REFERENCES work_item(id), to_id TEXT NOT NULL REFERENCES work_item(id), "
      "kind TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (from_id, to_id, kind));",
      "CREATE INDEX IF NOT EXISTS idx_work_item_edge_to ON work_item_edge(to_id);",
      "CREATE TABLE IF NOT EXISTS retired_work_item (id TEXT PRIMARY KEY, retired_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS workgraph_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO workgraph_schema_migrations(version, applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kSchema;
}

} // namespace workgraph::db::sql
