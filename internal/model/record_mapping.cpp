#include "internal/model/record_mapping.hpp"

namespace workgraph::model {

db::model::WorkItemRecord ToRecord(const WorkItem& item) {
  db::model::WorkItemRecord record;
  record.id                     = item.id;
  record.title                  = item.title;
  record.status                 = std::string(ToString(item.status));
  record.priority               = std::string(ToString(item.priority));
  record.item_type              = std::string(ToString(item.item_type));
  record.estimated_effort_hours = item.estimated_effort_hours;
  record.created_at_ms          = util::ToUnixMillis(item.created_at);
  record.updated_at_ms          = util::ToUnixMillis(item.updated_at);
  return record;
}

WorkItem FromRecord(const db::model::WorkItemRecord& record) {
  WorkItem item;
  item.id                     = record.id;
  item.title                  = record.title;
  item.status                 = ParseStatus(record.status);
  item.priority               = ParsePriority(record.priority);
  item.item_type              = ParseItemType(record.item_type);
  item.estimated_effort_hours = record.estimated_effort_hours;
  item.created_at             = util::FromUnixMillis(record.created_at_ms);
  item.updated_at             = util::FromUnixMillis(record.updated_at_ms);
  return item;
}

db::model::EdgeRecord ToRecord(const Edge& edge, util::TimePoint created_at) {
  db::model::EdgeRecord record;
  record.from_id       = edge.from_id;
  record.to_id         = edge.to_id;
  record.kind          = std::string(ToString(edge.kind));
  record.created_at_ms = util::ToUnixMillis(created_at);
  return record;
}

Edge FromRecord(const db::model::EdgeRecord& record) {
  return Edge{record.from_id, record.to_id, ParseEdgeKind(record.kind)};
}

} // namespace workgraph::model
