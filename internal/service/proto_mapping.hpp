#pragma once

#include "internal/analytics/analytics_records.hpp"
#include "internal/index/graph_index.hpp"
#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"
#include "workgraph/v1.hpp"

namespace workgraph::service {

/*
  Domain <-> wire conversions.

  The *FromProto functions throw util::ValidationError on UNSPECIFIED or
  unknown enum values; the Optional* variants map UNSPECIFIED to nullopt.
*/

workgraph::v1::WorkItemStatus ToProto(model::Status status);
workgraph::v1::Priority       ToProto(model::Priority priority);
workgraph::v1::ItemType       ToProto(model::ItemType type);
workgraph::v1::EdgeKind       ToProto(model::EdgeKind kind);

model::Status   StatusFromProto(workgraph::v1::WorkItemStatus status);
model::Priority PriorityFromProto(workgraph::v1::Priority priority);
model::ItemType ItemTypeFromProto(workgraph::v1::ItemType type);
model::EdgeKind EdgeKindFromProto(workgraph::v1::EdgeKind kind);

std::optional<model::Status>   OptionalStatus(workgraph::v1::WorkItemStatus status);
std::optional<model::Priority> OptionalPriority(workgraph::v1::Priority priority);
std::optional<model::ItemType> OptionalItemType(workgraph::v1::ItemType type);

workgraph::v1::WorkItem ToProto(const model::WorkItem& item);
workgraph::v1::Edge     ToProto(const model::Edge& edge);
model::Edge             EdgeFromProto(const workgraph::v1::Edge& edge);

workgraph::v1::Bottleneck     ToProto(const analytics::Bottleneck& bottleneck);
workgraph::v1::ParallelWork   ToProto(const analytics::ParallelWork& work);
workgraph::v1::Recommendation ToProto(const analytics::Recommendation& recommendation);
workgraph::v1::RiskAssessment ToProto(const analytics::RiskAssessment& assessment);
workgraph::v1::ImpactAnalysis ToProto(const analytics::ImpactAnalysis& impact);
workgraph::v1::WorkQueueEntry ToProto(const analytics::WorkQueueEntry& entry);
workgraph::v1::IndexStats     ToProto(const index::IndexStats& stats);

} // namespace workgraph::service
