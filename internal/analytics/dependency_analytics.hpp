#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/analytics/analytics_records.hpp"
#include "internal/analytics/analytics_weights.hpp"
#include "internal/graph/graph_snapshot.hpp"

namespace workgraph::analytics {

/*
  DependencyAnalytics

  Read-only analyses over one GraphSnapshot. Every operation is a pure
  function of the snapshot, the weights and its arguments.

  The optional deadline is checked between node computations; on expiry
  util::DeadlineExceeded is thrown and nothing is returned.

  Cycles in the blocks graph are results, never errors: layering leaves
  cycle members out and AssessRisks reports them.

  The snapshot must outlive this object.
*/
class DependencyAnalytics {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  explicit DependencyAnalytics(const graph::GraphSnapshot& snapshot, AnalyticsWeights weights = {},
                               std::optional<Deadline> deadline = std::nullopt);

  // Non-done nodes ranked by weighted impact, then transitive count, then id.
  std::vector<Bottleneck> FindBottlenecks(std::size_t top_n = 5, std::size_t min_impact = 1) const;

  // Kahn-style layering of the nodes in status_filter.
  ParallelWork GetParallelWork(std::size_t max_agents = 5, model::Status status_filter = model::Status::kTodo) const;

  RecommendationSet RecommendNextWork(std::size_t agent_count = 1, std::size_t lookahead = 5) const;

  RiskAssessment AssessRisks(std::size_t spof_threshold = 2) const;

  // Throws util::NotFound for an unknown id.
  ImpactAnalysis AnalyzeImpact(const std::string& node_id) const;

  // Ready todo items in recommendation order, then in-progress items, then
  // (include_blocked) everything still waiting on a blocker.
  std::vector<WorkQueueEntry> GetWorkQueue(std::size_t max_items = 10, bool include_blocked = false) const;

  const AnalyticsWeights& Weights() const {
    return weights_;
  }

 private:
  void CheckDeadline(std::string_view operation) const;

  bool IsDone(const std::string& id) const;

  // Non-done nodes blocking id.
  std::vector<std::string> UnresolvedBlockers(const std::string& id) const;

  // Nodes reachable from id over blocks edges, excluding id and done nodes.
  std::set<std::string> TransitiveBlocked(const std::string& id, std::string_view operation) const;

  // todo nodes whose blockers are all done (layer 0), ascending.
  std::vector<std::string> ReadyNow() const;

  double Score(const model::WorkItem& item) const;

  // Ranked candidates: score desc, unlocks desc, id asc.
  std::vector<Recommendation> Rank(const std::vector<std::string>& candidates, std::string_view operation) const;

  const graph::GraphSnapshot& snapshot_;
  AnalyticsWeights            weights_;
  std::optional<Deadline>     deadline_;
};

} // namespace workgraph::analytics
