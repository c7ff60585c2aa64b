#include "internal/model/work_item.hpp"

#include <cmath>
#include <string>

#include "internal/model/edge.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace workgraph::model {

Status ParseStatus(std::string_view value) {
  if (value == "todo") return Status::kTodo;
  if (value == "in-progress" || value == "in_progress") return Status::kInProgress;
  if (value == "blocked") return Status::kBlocked;
  if (value == "done") return Status::kDone;
  throw util::ValidationError("unknown status: '" + std::string(value) + "'");
}

Priority ParsePriority(std::string_view value) {
  if (value == "low") return Priority::kLow;
  if (value == "medium") return Priority::kMedium;
  if (value == "high") return Priority::kHigh;
  if (value == "critical") return Priority::kCritical;
  throw util::ValidationError("unknown priority: '" + std::string(value) + "'");
}

ItemType ParseItemType(std::string_view value) {
  if (value == "feature") return ItemType::kFeature;
  if (value == "bug") return ItemType::kBug;
  if (value == "track") return ItemType::kTrack;
  if (value == "epic") return ItemType::kEpic;
  throw util::ValidationError("unknown item type: '" + std::string(value) + "'");
}

EdgeKind ParseEdgeKind(std::string_view value) {
  if (value == "blocks") return EdgeKind::kBlocks;
  if (value == "parent_of" || value == "parent-of") return EdgeKind::kParentOf;
  throw util::ValidationError("unknown edge kind: '" + std::string(value) + "'");
}

void Validate(const WorkItem& item) {
  if (!util::IsValidId(item.id)) {
    throw util::ValidationError("invalid work item id: '" + item.id + "'");
  }
  if (item.estimated_effort_hours) {
    const double effort = *item.estimated_effort_hours;
    if (!std::isfinite(effort) || effort < 0.0) {
      throw util::ValidationError("work item " + item.id + ": estimated_effort_hours must be a non-negative number");
    }
  }
  if (item.updated_at < item.created_at) {
    throw util::ValidationError("work item " + item.id + ": updated_at precedes created_at");
  }
}

} // namespace workgraph::model
