#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/work_item.hpp"

namespace workgraph::analytics {

/*
  Plain result records of the analytics operations.

  Id lists are sorted ascending unless noted otherwise.
*/

struct Bottleneck {
  std::string     id;
  std::string     title;
  model::Status   status   = model::Status::kTodo;
  model::Priority priority = model::Priority::kMedium;

  std::size_t blocks_count     = 0; // |direct_blocked|
  std::size_t transitive_count = 0; // |transitive_blocked|, done nodes excluded
  double      impact_score     = 0.0;

  std::vector<std::string> blocked_tasks;
};

struct ParallelWork {
  std::size_t max_parallelism = 0;
  std::size_t total_ready     = 0;
  std::size_t level_count     = 0;

  std::vector<std::string> ready_now;  // layer 0
  std::vector<std::string> next_level; // layer 1, empty if absent

  std::vector<std::vector<std::string>> levels;

  // non-done ids inside a blocks cycle
  std::vector<std::string> cycle_members;

  // other non-done ids that never became ready
  std::vector<std::string> unassigned;

  // "agent-1".."agent-k" -> ready ids, round robin over ready_now
  std::map<std::string, std::vector<std::string>> suggested_assignments;
};

struct Recommendation {
  std::string     id;
  std::string     title;
  model::Priority priority = model::Priority::kMedium;

  double                   score = 0.0;
  std::vector<std::string> reasons;

  std::optional<double> estimated_hours;

  std::size_t              unlocks_count = 0;
  std::vector<std::string> unlocks;
};

struct RecommendationSet {
  // best first
  std::vector<Recommendation> recommendations;

  // first min(agent_count, n) recommended ids; mutually independent
  std::vector<std::string> parallel_batch;
};

struct RiskTask {
  std::string     id;
  std::string     title;
  model::Priority priority = model::Priority::kMedium;

  std::size_t              blocks_count = 0;
  double                   risk_score   = 0.0;
  std::vector<std::string> risk_factors;
};

struct RiskAssessment {
  // risk_score desc, id asc
  std::vector<RiskTask> high_risk_tasks;

  // each rotated to start at its smallest id
  std::vector<std::vector<std::string>> circular_dependencies;

  std::vector<std::string> orphaned_tasks;
  std::vector<std::string> recommendations;
};

struct ImpactAnalysis {
  std::string node_id;

  std::size_t direct_dependents = 0;
  std::size_t total_impact      = 0;
  double      completion_impact = 0.0; // percent of the remaining work

  std::vector<std::string> direct_nodes;
  std::vector<std::string> affected_nodes;
};

struct WorkQueueEntry {
  std::string     id;
  std::string     title;
  model::Status   status   = model::Status::kTodo;
  model::Priority priority = model::Priority::kMedium;

  double score = 0.0;
  bool   ready = false;

  // unresolved blockers
  std::vector<std::string> blocked_by;
};

} // namespace workgraph::analytics
