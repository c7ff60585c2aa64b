#include "analytics_service.hpp"

#include <chrono>

#include "internal/index/graph_index.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/util/errors.hpp"

namespace workgraph::service {

using namespace workgraph::v1;

namespace {

constexpr uint32_t kDefaultTopN          = 5;
constexpr uint32_t kDefaultMinImpact     = 1;
constexpr uint32_t kDefaultMaxAgents     = 5;
constexpr uint32_t kDefaultAgentCount    = 1;
constexpr uint32_t kDefaultLookahead     = 5;
constexpr uint32_t kDefaultSpofThreshold = 2;
constexpr uint32_t kDefaultMaxQueueItems = 10;

uint32_t OrDefault(uint32_t value, uint32_t fallback) {
  return value == 0 ? fallback : value;
}

} // namespace

AnalyticsService::AnalyticsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::optional<AnalyticsService::Deadline> AnalyticsService::EffectiveDeadline(std::optional<Deadline> deadline) const {
  if (deadline) {
    return deadline;
  }
  if (ctx_.default_deadline_ms > 0) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ctx_.default_deadline_ms);
  }
  return std::nullopt;
}

FindBottlenecksResponse AnalyticsService::FindBottlenecks(const FindBottlenecksRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.FindBottlenecks", "", [&] {
    // min_impact = 0 is a meaningful request, so presence decides the default
    const uint32_t min_impact = req.has_min_impact() ? req.min_impact() : kDefaultMinImpact;

    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    FindBottlenecksResponse resp;
    for (const auto& bottleneck : engine.FindBottlenecks(OrDefault(req.top_n(), kDefaultTopN), min_impact)) {
      *resp.add_bottlenecks() = ToProto(bottleneck);
    }
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

GetParallelWorkResponse AnalyticsService::GetParallelWork(const GetParallelWorkRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.GetParallelWork", "", [&] {
    const auto status_filter = OptionalStatus(req.status_filter()).value_or(model::Status::kTodo);

    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    GetParallelWorkResponse resp;
    *resp.mutable_parallel_work() = ToProto(engine.GetParallelWork(OrDefault(req.max_agents(), kDefaultMaxAgents), status_filter));
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

RecommendNextWorkResponse AnalyticsService::RecommendNextWork(const RecommendNextWorkRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.RecommendNextWork", "", [&] {
    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    const auto result = engine.RecommendNextWork(OrDefault(req.agent_count(), kDefaultAgentCount), OrDefault(req.lookahead(), kDefaultLookahead));

    RecommendNextWorkResponse resp;
    for (const auto& recommendation : result.recommendations) {
      *resp.add_recommendations() = ToProto(recommendation);
    }
    for (const auto& id : result.parallel_batch) {
      resp.add_parallel_batch(id);
    }
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

AssessRisksResponse AnalyticsService::AssessRisks(const AssessRisksRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.AssessRisks", "", [&] {
    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    AssessRisksResponse resp;
    *resp.mutable_assessment() = ToProto(engine.AssessRisks(OrDefault(req.spof_threshold(), kDefaultSpofThreshold)));
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

AnalyzeImpactResponse AnalyticsService::AnalyzeImpact(const AnalyzeImpactRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.AnalyzeImpact", req.node_id(), [&] {
    if (req.node_id().empty()) {
      throw util::ValidationError("node_id is required");
    }

    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    AnalyzeImpactResponse resp;
    *resp.mutable_impact() = ToProto(engine.AnalyzeImpact(req.node_id()));
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

GetWorkQueueResponse AnalyticsService::GetWorkQueue(const GetWorkQueueRequest& req, std::optional<Deadline> deadline) {
  return ObserveRpc("AnalyticsService.GetWorkQueue", "", [&] {
    auto                           snapshot = ctx_.index->Snapshot();
    analytics::DependencyAnalytics engine(*snapshot, ctx_.weights, EffectiveDeadline(deadline));

    GetWorkQueueResponse resp;
    for (const auto& entry : engine.GetWorkQueue(OrDefault(req.max_items(), kDefaultMaxQueueItems), req.include_blocked())) {
      *resp.add_entries() = ToProto(entry);
    }
    resp.set_snapshot_version(snapshot->Version());
    return resp;
  });
}

} // namespace workgraph::service
