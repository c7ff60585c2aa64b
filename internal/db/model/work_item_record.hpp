#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace workgraph::db::model {

/*
  Persistent work item row.

  Enum columns are stored in their canonical text spelling so that the
  database stays readable and the store owns the mapping to domain enums.
*/

struct WorkItemRecord {
  std::string id;
  std::string title;

  std::string status;    // "todo", "in-progress", "blocked", "done"
  std::string priority;  // "low", "medium", "high", "critical"
  std::string item_type; // "feature", "bug", "track", "epic"

  std::optional<double> estimated_effort_hours;

  // epoch ms
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace workgraph::db::model
