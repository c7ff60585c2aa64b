#pragma once

#include <string>
#include <vector>

namespace workgraph::db::sql {

// Implemented by SQL backends so the work item schema can be applied to them.

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Executes each statement in order; the first failure propagates.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// work_item, work_item_edge, retired_work_item and their indexes; every statement is IF NOT EXISTS.
const std::vector<std::string>& WorkGraphSchema();

} // namespace workgraph::db::sql
