#include "internal/service/proto_mapping.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace workgraph::service {

using namespace workgraph::v1;

namespace {

template <typename Range>
void CopyIds(const Range& ids, google::protobuf::RepeatedPtrField<std::string>* out) {
  for (const auto& id : ids) {
    out->Add(std::string(id));
  }
}

} // namespace

// ------------------------------------------------------------
// Enums
// ------------------------------------------------------------

WorkItemStatus ToProto(model::Status status) {
  switch (status) {
    case model::Status::kTodo:
      return WORK_ITEM_STATUS_TODO;
    case model::Status::kInProgress:
      return WORK_ITEM_STATUS_IN_PROGRESS;
    case model::Status::kBlocked:
      return WORK_ITEM_STATUS_BLOCKED;
    case model::Status::kDone:
      return WORK_ITEM_STATUS_DONE;
  }
  return WORK_ITEM_STATUS_UNSPECIFIED;
}

Priority ToProto(model::Priority priority) {
  switch (priority) {
    case model::Priority::kLow:
      return PRIORITY_LOW;
    case model::Priority::kMedium:
      return PRIORITY_MEDIUM;
    case model::Priority::kHigh:
      return PRIORITY_HIGH;
    case model::Priority::kCritical:
      return PRIORITY_CRITICAL;
  }
  return PRIORITY_UNSPECIFIED;
}

ItemType ToProto(model::ItemType type) {
  switch (type) {
    case model::ItemType::kFeature:
      return ITEM_TYPE_FEATURE;
    case model::ItemType::kBug:
      return ITEM_TYPE_BUG;
    case model::ItemType::kTrack:
      return ITEM_TYPE_TRACK;
    case model::ItemType::kEpic:
      return ITEM_TYPE_EPIC;
  }
  return ITEM_TYPE_UNSPECIFIED;
}

EdgeKind ToProto(model::EdgeKind kind) {
  switch (kind) {
    case model::EdgeKind::kBlocks:
      return EDGE_KIND_BLOCKS;
    case model::EdgeKind::kParentOf:
      return EDGE_KIND_PARENT_OF;
  }
  return EDGE_KIND_UNSPECIFIED;
}

std::optional<model::Status> OptionalStatus(WorkItemStatus status) {
  switch (status) {
    case WORK_ITEM_STATUS_TODO:
      return model::Status::kTodo;
    case WORK_ITEM_STATUS_IN_PROGRESS:
      return model::Status::kInProgress;
    case WORK_ITEM_STATUS_BLOCKED:
      return model::Status::kBlocked;
    case WORK_ITEM_STATUS_DONE:
      return model::Status::kDone;
    case WORK_ITEM_STATUS_UNSPECIFIED:
      return std::nullopt;
    default:
      throw util::ValidationError("unknown status value " + std::to_string(static_cast<int>(status)));
  }
}

std::optional<model::Priority> OptionalPriority(Priority priority) {
  switch (priority) {
    case PRIORITY_LOW:
      return model::Priority::kLow;
    case PRIORITY_MEDIUM:
      return model::Priority::kMedium;
    case PRIORITY_HIGH:
      return model::Priority::kHigh;
    case PRIORITY_CRITICAL:
      return model::Priority::kCritical;
    case PRIORITY_UNSPECIFIED:
      return std::nullopt;
    default:
      throw util::ValidationError("unknown priority value " + std::to_string(static_cast<int>(priority)));
  }
}

std::optional<model::ItemType> OptionalItemType(ItemType type) {
  switch (type) {
    case ITEM_TYPE_FEATURE:
      return model::ItemType::kFeature;
    case ITEM_TYPE_BUG:
      return model::ItemType::kBug;
    case ITEM_TYPE_TRACK:
      return model::ItemType::kTrack;
    case ITEM_TYPE_EPIC:
      return model::ItemType::kEpic;
    case ITEM_TYPE_UNSPECIFIED:
      return std::nullopt;
    default:
      throw util::ValidationError("unknown item type value " + std::to_string(static_cast<int>(type)));
  }
}

model::Status StatusFromProto(WorkItemStatus status) {
  auto value = OptionalStatus(status);
  if (!value) throw util::ValidationError("status is required");
  return *value;
}

model::Priority PriorityFromProto(Priority priority) {
  auto value = OptionalPriority(priority);
  if (!value) throw util::ValidationError("priority is required");
  return *value;
}

model::ItemType ItemTypeFromProto(ItemType type) {
  auto value = OptionalItemType(type);
  if (!value) throw util::ValidationError("item_type is required");
  return *value;
}

model::EdgeKind EdgeKindFromProto(EdgeKind kind) {
  switch (kind) {
    case EDGE_KIND_BLOCKS:
      return model::EdgeKind::kBlocks;
    case EDGE_KIND_PARENT_OF:
      return model::EdgeKind::kParentOf;
    default:
      throw util::ValidationError("edge kind is required");
  }
}

// ------------------------------------------------------------
// Items and edges
// ------------------------------------------------------------

WorkItem ToProto(const model::WorkItem& item) {
  WorkItem out;
  out.set_id(item.id);
  out.set_title(item.title);
  out.set_status(ToProto(item.status));
  out.set_priority(ToProto(item.priority));
  out.set_item_type(ToProto(item.item_type));
  if (item.estimated_effort_hours) {
    out.set_estimated_effort_hours(*item.estimated_effort_hours);
  }
  *out.mutable_created_at() = util::ToProto(item.created_at);
  *out.mutable_updated_at() = util::ToProto(item.updated_at);
  return out;
}

Edge ToProto(const model::Edge& edge) {
  Edge out;
  out.set_from_id(edge.from_id);
  out.set_to_id(edge.to_id);
  out.set_kind(ToProto(edge.kind));
  return out;
}

model::Edge EdgeFromProto(const Edge& edge) {
  if (edge.from_id().empty() || edge.to_id().empty()) {
    throw util::ValidationError("edge endpoints are required");
  }
  return model::Edge{edge.from_id(), edge.to_id(), EdgeKindFromProto(edge.kind())};
}

// ------------------------------------------------------------
// Analytics records
// ------------------------------------------------------------

Bottleneck ToProto(const analytics::Bottleneck& bottleneck) {
  Bottleneck out;
  out.set_id(bottleneck.id);
  out.set_title(bottleneck.title);
  out.set_status(ToProto(bottleneck.status));
  out.set_priority(ToProto(bottleneck.priority));
  out.set_blocks_count(static_cast<uint32_t>(bottleneck.blocks_count));
  out.set_transitive_count(static_cast<uint32_t>(bottleneck.transitive_count));
  out.set_impact_score(bottleneck.impact_score);
  CopyIds(bottleneck.blocked_tasks, out.mutable_blocked_tasks());
  return out;
}

ParallelWork ToProto(const analytics::ParallelWork& work) {
  ParallelWork out;
  out.set_max_parallelism(static_cast<uint32_t>(work.max_parallelism));
  out.set_total_ready(static_cast<uint32_t>(work.total_ready));
  out.set_level_count(static_cast<uint32_t>(work.level_count));
  CopyIds(work.ready_now, out.mutable_ready_now());
  CopyIds(work.next_level, out.mutable_next_level());
  for (const auto& level : work.levels) {
    CopyIds(level, out.add_levels()->mutable_ids());
  }
  CopyIds(work.cycle_members, out.mutable_cycle_members());
  CopyIds(work.unassigned, out.mutable_unassigned());
  for (const auto& [agent, ids] : work.suggested_assignments) {
    CopyIds(ids, (*out.mutable_suggested_assignments())[agent].mutable_ids());
  }
  return out;
}

Recommendation ToProto(const analytics::Recommendation& recommendation) {
  Recommendation out;
  out.set_id(recommendation.id);
  out.set_title(recommendation.title);
  out.set_priority(ToProto(recommendation.priority));
  out.set_score(recommendation.score);
  CopyIds(recommendation.reasons, out.mutable_reasons());
  if (recommendation.estimated_hours) {
    out.set_estimated_hours(*recommendation.estimated_hours);
  }
  out.set_unlocks_count(static_cast<uint32_t>(recommendation.unlocks_count));
  CopyIds(recommendation.unlocks, out.mutable_unlocks());
  return out;
}

RiskAssessment ToProto(const analytics::RiskAssessment& assessment) {
  RiskAssessment out;
  for (const auto& risk : assessment.high_risk_tasks) {
    auto* task = out.add_high_risk_tasks();
    task->set_id(risk.id);
    task->set_title(risk.title);
    task->set_priority(ToProto(risk.priority));
    task->set_blocks_count(static_cast<uint32_t>(risk.blocks_count));
    task->set_risk_score(risk.risk_score);
    CopyIds(risk.risk_factors, task->mutable_risk_factors());
  }
  for (const auto& cycle : assessment.circular_dependencies) {
    CopyIds(cycle, out.add_circular_dependencies()->mutable_ids());
  }
  CopyIds(assessment.orphaned_tasks, out.mutable_orphaned_tasks());
  CopyIds(assessment.recommendations, out.mutable_recommendations());
  return out;
}

ImpactAnalysis ToProto(const analytics::ImpactAnalysis& impact) {
  ImpactAnalysis out;
  out.set_node_id(impact.node_id);
  out.set_direct_dependents(static_cast<uint32_t>(impact.direct_dependents));
  out.set_total_impact(static_cast<uint32_t>(impact.total_impact));
  out.set_completion_impact(impact.completion_impact);
  CopyIds(impact.direct_nodes, out.mutable_direct_nodes());
  CopyIds(impact.affected_nodes, out.mutable_affected_nodes());
  return out;
}

WorkQueueEntry ToProto(const analytics::WorkQueueEntry& entry) {
  WorkQueueEntry out;
  out.set_id(entry.id);
  out.set_title(entry.title);
  out.set_status(ToProto(entry.status));
  out.set_priority(ToProto(entry.priority));
  out.set_score(entry.score);
  out.set_ready(entry.ready);
  CopyIds(entry.blocked_by, out.mutable_blocked_by());
  return out;
}

IndexStats ToProto(const index::IndexStats& stats) {
  IndexStats out;
  out.set_node_count(stats.node_count);
  out.set_blocks_edge_count(stats.blocks_edge_count);
  out.set_parent_of_edge_count(stats.parent_of_edge_count);
  out.set_version(stats.version);
  out.set_rebuild_count(stats.rebuild_count);
  out.set_shard_count(static_cast<uint32_t>(stats.shard_count));
  return out;
}

} // namespace workgraph::service
