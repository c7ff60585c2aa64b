#pragma once

#include <optional>

#include "internal/analytics/dependency_analytics.hpp"
#include "internal/service/service_context.hpp"
#include "workgraph/v1.hpp"

namespace workgraph::service {

/*
  Dependency analytics over the current index snapshot.

  Each call cuts (or reuses) one snapshot and runs a single analysis on it,
  so a response always describes one consistent state of the graph.
  Zero-valued request parameters select the defaults.
*/
class AnalyticsService {
 public:
  using Deadline = analytics::DependencyAnalytics::Deadline;

  explicit AnalyticsService(ServiceContext ctx);

  workgraph::v1::FindBottlenecksResponse FindBottlenecks(const workgraph::v1::FindBottlenecksRequest& req,
                                                         std::optional<Deadline> deadline = std::nullopt);

  workgraph::v1::GetParallelWorkResponse GetParallelWork(const workgraph::v1::GetParallelWorkRequest& req,
                                                         std::optional<Deadline> deadline = std::nullopt);

  workgraph::v1::RecommendNextWorkResponse RecommendNextWork(const workgraph::v1::RecommendNextWorkRequest& req,
                                                             std::optional<Deadline> deadline = std::nullopt);

  workgraph::v1::AssessRisksResponse AssessRisks(const workgraph::v1::AssessRisksRequest& req,
                                                 std::optional<Deadline> deadline = std::nullopt);

  workgraph::v1::AnalyzeImpactResponse AnalyzeImpact(const workgraph::v1::AnalyzeImpactRequest& req,
                                                     std::optional<Deadline> deadline = std::nullopt);

  workgraph::v1::GetWorkQueueResponse GetWorkQueue(const workgraph::v1::GetWorkQueueRequest& req,
                                                   std::optional<Deadline> deadline = std::nullopt);

 private:
  // Caller deadline, else the configured default, else none.
  std::optional<Deadline> EffectiveDeadline(std::optional<Deadline> deadline) const;

  ServiceContext ctx_;
};

} // namespace workgraph::service
