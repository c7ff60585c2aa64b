#include "internal/analytics/dependency_analytics.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <tuple>

#include "internal/graph/graph_algorithms.hpp"
#include "internal/util/errors.hpp"

namespace workgraph::analytics {

namespace {

std::string Tasks(std::size_t n) {
  return std::to_string(n) + (n == 1 ? " task" : " tasks");
}

std::vector<std::string> ToVector(const graph::IdSet& ids) {
  return {ids.begin(), ids.end()};
}

} // namespace

DependencyAnalytics::DependencyAnalytics(const graph::GraphSnapshot& snapshot, AnalyticsWeights weights,
                                         std::optional<Deadline> deadline)
    : snapshot_(snapshot), weights_(std::move(weights)), deadline_(deadline) {
}

void DependencyAnalytics::CheckDeadline(std::string_view operation) const {
  if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
    throw util::DeadlineExceeded(std::string(operation) + ": deadline exceeded");
  }
}

bool DependencyAnalytics::IsDone(const std::string& id) const {
  const auto* item = snapshot_.Find(id);
  return item && model::IsDone(item->status);
}

std::vector<std::string> DependencyAnalytics::UnresolvedBlockers(const std::string& id) const {
  std::vector<std::string> blockers;
  for (const auto& blocker : snapshot_.Backward(id)) {
    if (!IsDone(blocker)) {
      blockers.push_back(blocker);
    }
  }
  return blockers;
}

std::set<std::string> DependencyAnalytics::TransitiveBlocked(const std::string& id, std::string_view operation) const {
  std::set<std::string>   visited{id};
  std::deque<std::string> frontier{id};

  while (!frontier.empty()) {
    CheckDeadline(operation);
    auto current = std::move(frontier.front());
    frontier.pop_front();
    for (const auto& next : snapshot_.Forward(current)) {
      if (visited.insert(next).second) {
        frontier.push_back(next);
      }
    }
  }

  visited.erase(id);
  std::erase_if(visited, [this](const std::string& node) { return IsDone(node); });
  return visited;
}

std::vector<std::string> DependencyAnalytics::ReadyNow() const {
  std::vector<std::string> ready;
  for (const auto& [id, item] : snapshot_.Nodes()) {
    if (item.status == model::Status::kTodo && UnresolvedBlockers(id).empty()) {
      ready.push_back(id);
    }
  }
  return ready;
}

double DependencyAnalytics::Score(const model::WorkItem& item) const {
  const auto unlocks = snapshot_.Forward(item.id).size();
  return weights_.priority_score_multiplier * weights_.PriorityWeight(item.priority) +
         weights_.unlock_score_multiplier * static_cast<double>(unlocks) - weights_.EffortPenalty(item.estimated_effort_hours);
}

std::vector<Recommendation> DependencyAnalytics::Rank(const std::vector<std::string>& candidates, std::string_view operation) const {
  std::vector<Recommendation> ranked;
  ranked.reserve(candidates.size());

  for (const auto& id : candidates) {
    CheckDeadline(operation);
    const auto& item = snapshot_.Get(id);

    Recommendation rec;
    rec.id              = item.id;
    rec.title           = item.title;
    rec.priority        = item.priority;
    rec.estimated_hours = item.estimated_effort_hours;
    rec.unlocks         = ToVector(snapshot_.Forward(id));
    rec.unlocks_count   = rec.unlocks.size();
    rec.score           = Score(item);

    if (model::IsAtLeast(item.priority, weights_.high_priority_floor)) {
      rec.reasons.push_back("high priority");
    }
    if (rec.unlocks_count >= weights_.unlock_reason_threshold) {
      rec.reasons.push_back("unblocks " + Tasks(rec.unlocks_count));
    }
    if (item.estimated_effort_hours && *item.estimated_effort_hours <= weights_.quick_win_max_hours) {
      rec.reasons.push_back("quick win");
    }
    if (UnresolvedBlockers(id).empty()) {
      rec.reasons.push_back("ready to start now");
    }

    ranked.push_back(std::move(rec));
  }

  std::sort(ranked.begin(), ranked.end(), [](const Recommendation& a, const Recommendation& b) {
    return std::make_tuple(-a.score, b.unlocks_count, a.id) < std::make_tuple(-b.score, a.unlocks_count, b.id);
  });
  return ranked;
}

// ------------------------------------------------------------
// Bottlenecks
// ------------------------------------------------------------

std::vector<Bottleneck> DependencyAnalytics::FindBottlenecks(std::size_t top_n, std::size_t min_impact) const {
  constexpr std::string_view kOperation = "find_bottlenecks";
  CheckDeadline(kOperation);

  const auto                dense = graph::DenseGraph::Build(snapshot_);
  const graph::Reachability reach(dense, [this, kOperation] { CheckDeadline(kOperation); });

  std::vector<Bottleneck> bottlenecks;
  for (std::size_t v = 0; v < dense.Size(); ++v) {
    CheckDeadline(kOperation);

    const auto& item = *dense.items[v];
    if (model::IsDone(item.status)) {
      continue;
    }

    const auto& direct = snapshot_.Forward(item.id);
    if (direct.size() < min_impact) {
      continue;
    }

    double impact = 0.0;
    for (const auto& target : direct) {
      impact += weights_.PriorityWeight(snapshot_.Get(target).priority);
    }

    std::size_t transitive_count = 0;
    reach.From(v).ForEach([&](std::size_t u) {
      if (u == v || model::IsDone(dense.items[u]->status)) {
        return;
      }
      ++transitive_count;
      if (!direct.contains(dense.ids[u])) {
        impact += weights_.transitive_factor * weights_.PriorityWeight(dense.items[u]->priority);
      }
    });

    Bottleneck bottleneck;
    bottleneck.id               = item.id;
    bottleneck.title            = item.title;
    bottleneck.status           = item.status;
    bottleneck.priority         = item.priority;
    bottleneck.blocks_count     = direct.size();
    bottleneck.transitive_count = transitive_count;
    bottleneck.impact_score     = impact;
    bottleneck.blocked_tasks    = ToVector(direct);
    bottlenecks.push_back(std::move(bottleneck));
  }

  std::sort(bottlenecks.begin(), bottlenecks.end(), [](const Bottleneck& a, const Bottleneck& b) {
    return std::make_tuple(-a.impact_score, b.transitive_count, a.id) < std::make_tuple(-b.impact_score, a.transitive_count, b.id);
  });

  if (bottlenecks.size() > top_n) {
    bottlenecks.resize(top_n);
  }
  return bottlenecks;
}

// ------------------------------------------------------------
// Parallel work
// ------------------------------------------------------------

ParallelWork DependencyAnalytics::GetParallelWork(std::size_t max_agents, model::Status status_filter) const {
  constexpr std::string_view kOperation = "get_parallel_work";
  if (max_agents == 0) {
    throw util::ValidationError("max_agents must be at least 1");
  }
  CheckDeadline(kOperation);

  // unresolved = every non-done node; a node is ready once none of its
  // blockers is unresolved
  std::map<std::string, std::size_t> pending_blockers;
  std::set<std::string>              unresolved;
  std::vector<std::string>           current;

  for (const auto& [id, item] : snapshot_.Nodes()) {
    if (model::IsDone(item.status)) {
      continue;
    }
    unresolved.insert(id);
    const auto pending   = UnresolvedBlockers(id).size();
    pending_blockers[id] = pending;
    if (pending == 0 && item.status == status_filter) {
      current.push_back(id);
    }
  }

  ParallelWork result;
  while (!current.empty()) {
    CheckDeadline(kOperation);

    for (const auto& id : current) {
      unresolved.erase(id);
    }

    std::set<std::string> next;
    for (const auto& id : current) {
      for (const auto& dependent : snapshot_.Forward(id)) {
        auto it = pending_blockers.find(dependent);
        if (it == pending_blockers.end() || it->second == 0) {
          continue;
        }
        if (--it->second == 0 && unresolved.contains(dependent) && snapshot_.Get(dependent).status == status_filter) {
          next.insert(dependent);
        }
      }
    }

    result.levels.push_back(std::move(current));
    current.assign(next.begin(), next.end());
  }

  const auto non_done = graph::DenseGraph::Build(snapshot_, [](const model::WorkItem& item) { return !model::IsDone(item.status); });
  std::set<std::string> cycle_members;
  for (const auto& component : graph::StronglyConnectedComponents(non_done)) {
    if (component.size() > 1) {
      for (auto v : component) {
        cycle_members.insert(non_done.ids[v]);
      }
    }
  }

  for (const auto& id : unresolved) {
    if (cycle_members.contains(id)) {
      result.cycle_members.push_back(id);
    } else {
      result.unassigned.push_back(id);
    }
  }

  std::size_t widest = 0;
  for (const auto& level : result.levels) {
    widest = std::max(widest, level.size());
  }

  result.level_count     = result.levels.size();
  result.max_parallelism = std::min(widest, max_agents);
  if (!result.levels.empty()) {
    result.ready_now = result.levels.front();
  }
  if (result.levels.size() > 1) {
    result.next_level = result.levels[1];
  }
  result.total_ready = result.ready_now.size();

  const std::size_t agents = std::min(max_agents, result.ready_now.size());
  for (std::size_t i = 0; i < result.ready_now.size(); ++i) {
    result.suggested_assignments["agent-" + std::to_string(i % agents + 1)].push_back(result.ready_now[i]);
  }

  return result;
}

// ------------------------------------------------------------
// Recommendations
// ------------------------------------------------------------

RecommendationSet DependencyAnalytics::RecommendNextWork(std::size_t agent_count, std::size_t lookahead) const {
  constexpr std::string_view kOperation = "recommend_next_work";
  if (agent_count == 0) {
    throw util::ValidationError("agent_count must be at least 1");
  }
  CheckDeadline(kOperation);

  RecommendationSet result;
  result.recommendations = Rank(ReadyNow(), kOperation);

  const std::size_t limit = std::max(agent_count, lookahead);
  if (result.recommendations.size() > limit) {
    result.recommendations.resize(limit);
  }

  // layer 0 members never block each other
  const std::size_t batch = std::min(agent_count, result.recommendations.size());
  for (std::size_t i = 0; i < batch; ++i) {
    result.parallel_batch.push_back(result.recommendations[i].id);
  }
  return result;
}

// ------------------------------------------------------------
// Risks
// ------------------------------------------------------------

RiskAssessment DependencyAnalytics::AssessRisks(std::size_t spof_threshold) const {
  constexpr std::string_view kOperation = "assess_risks";
  if (spof_threshold == 0) {
    throw util::ValidationError("spof_threshold must be at least 1");
  }
  CheckDeadline(kOperation);

  RiskAssessment result;

  for (const auto& [id, item] : snapshot_.Nodes()) {
    CheckDeadline(kOperation);
    if (model::IsDone(item.status)) {
      continue;
    }

    const auto& forward  = snapshot_.Forward(id);
    const auto& backward = snapshot_.Backward(id);

    if (forward.empty() && backward.empty() && !snapshot_.InHierarchy(id)) {
      result.orphaned_tasks.push_back(id);
    }

    if (forward.size() < spof_threshold) {
      continue;
    }

    RiskTask risk;
    risk.id           = id;
    risk.title        = item.title;
    risk.priority     = item.priority;
    risk.blocks_count = forward.size();
    risk.risk_score   = static_cast<double>(forward.size()) * weights_.PriorityWeight(item.priority);
    risk.risk_factors.push_back("single point of failure — blocks " + Tasks(forward.size()));
    if (!UnresolvedBlockers(id).empty()) {
      risk.risk_factors.push_back("high-priority work is itself blocked");
    }
    result.high_risk_tasks.push_back(std::move(risk));
  }

  std::sort(result.high_risk_tasks.begin(), result.high_risk_tasks.end(), [](const RiskTask& a, const RiskTask& b) {
    return std::make_tuple(-a.risk_score, a.id) < std::make_tuple(-b.risk_score, b.id);
  });

  CheckDeadline(kOperation);
  result.circular_dependencies = graph::FindCycles(graph::DenseGraph::Build(snapshot_), [&] { CheckDeadline(kOperation); });

  for (const auto& risk : result.high_risk_tasks) {
    result.recommendations.push_back("Prioritize " + risk.id + " (" + risk.title + "): it blocks " + Tasks(risk.blocks_count));
  }
  for (const auto& cycle : result.circular_dependencies) {
    std::string text = "Break circular dependency: ";
    for (const auto& id : cycle) {
      text += id + " -> ";
    }
    text += cycle.front();
    result.recommendations.push_back(std::move(text));
  }

  return result;
}

// ------------------------------------------------------------
// Impact
// ------------------------------------------------------------

ImpactAnalysis DependencyAnalytics::AnalyzeImpact(const std::string& node_id) const {
  constexpr std::string_view kOperation = "analyze_impact";
  CheckDeadline(kOperation);

  snapshot_.Get(node_id); // throws NotFound

  const auto affected = TransitiveBlocked(node_id, kOperation);

  std::size_t non_done = 0;
  for (const auto& [id, item] : snapshot_.Nodes()) {
    if (!model::IsDone(item.status)) {
      ++non_done;
    }
  }

  ImpactAnalysis result;
  result.node_id           = node_id;
  result.direct_nodes      = ToVector(snapshot_.Forward(node_id));
  result.direct_dependents = result.direct_nodes.size();
  result.affected_nodes.assign(affected.begin(), affected.end());
  result.total_impact = affected.size();

  const auto denominator   = std::max<std::int64_t>(1, static_cast<std::int64_t>(non_done) - 1);
  result.completion_impact = static_cast<double>(result.total_impact) / static_cast<double>(denominator) * 100.0;
  return result;
}

// ------------------------------------------------------------
// Work queue
// ------------------------------------------------------------

std::vector<WorkQueueEntry> DependencyAnalytics::GetWorkQueue(std::size_t max_items, bool include_blocked) const {
  constexpr std::string_view kOperation = "get_work_queue";
  CheckDeadline(kOperation);

  std::vector<WorkQueueEntry> queue;
  std::set<std::string>       listed;

  auto append = [&](const model::WorkItem& item, double score) {
    WorkQueueEntry entry;
    entry.id         = item.id;
    entry.title      = item.title;
    entry.status     = item.status;
    entry.priority   = item.priority;
    entry.score      = score;
    entry.blocked_by = UnresolvedBlockers(item.id);
    entry.ready      = item.status == model::Status::kTodo && entry.blocked_by.empty();
    listed.insert(item.id);
    queue.push_back(std::move(entry));
  };

  for (const auto& rec : Rank(ReadyNow(), kOperation)) {
    append(snapshot_.Get(rec.id), rec.score);
  }

  auto by_score = [this](const model::WorkItem* a, const model::WorkItem* b) {
    const double sa = Score(*a);
    const double sb = Score(*b);
    return std::make_tuple(-sa, a->id) < std::make_tuple(-sb, b->id);
  };

  std::vector<const model::WorkItem*> in_progress;
  std::vector<const model::WorkItem*> waiting;
  for (const auto& [id, item] : snapshot_.Nodes()) {
    CheckDeadline(kOperation);
    if (model::IsDone(item.status) || listed.contains(id)) {
      continue;
    }
    if (item.status == model::Status::kInProgress) {
      in_progress.push_back(&item);
    } else {
      waiting.push_back(&item);
    }
  }

  std::sort(in_progress.begin(), in_progress.end(), by_score);
  for (const auto* item : in_progress) {
    append(*item, Score(*item));
  }

  if (include_blocked) {
    std::sort(waiting.begin(), waiting.end(), by_score);
    for (const auto* item : waiting) {
      append(*item, Score(*item));
    }
  }

  if (queue.size() > max_items) {
    queue.resize(max_items);
  }
  return queue;
}

} // namespace workgraph::analytics
