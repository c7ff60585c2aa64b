#pragma once

#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/work_item_record.hpp"
#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"

namespace workgraph::model {

/*
  Conversions between domain values and persisted records.

  FromRecord parses the text enum columns and throws util::ValidationError
  on spellings it does not know.
*/

db::model::WorkItemRecord ToRecord(const WorkItem& item);
WorkItem                  FromRecord(const db::model::WorkItemRecord& record);

db::model::EdgeRecord ToRecord(const Edge& edge, util::TimePoint created_at);
Edge                  FromRecord(const db::model::EdgeRecord& record);

} // namespace workgraph::model
