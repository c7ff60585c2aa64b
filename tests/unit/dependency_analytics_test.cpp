#include "internal/analytics/dependency_analytics.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/graph/graph_snapshot.hpp"
#include "internal/util/errors.hpp"

namespace {

using workgraph::analytics::DependencyAnalytics;
using workgraph::graph::GraphSnapshotBuilder;
using workgraph::model::Priority;
using workgraph::model::Status;
using workgraph::model::WorkItem;

WorkItem Item(const std::string& id, Priority priority = Priority::kMedium, Status status = Status::kTodo) {
  WorkItem item;
  item.id       = id;
  item.title    = "task " + id;
  item.priority = priority;
  item.status   = status;
  return item;
}

bool Contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// A(critical) blocks B and C, B blocks D, E stands alone.
std::shared_ptr<const workgraph::graph::GraphSnapshot> FiveNodeScenario() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A", Priority::kCritical)).AddNode(Item("B")).AddNode(Item("C")).AddNode(Item("D")).AddNode(Item("E"));
  builder.Blocks("A", "B").Blocks("A", "C").Blocks("B", "D");
  return builder.Build();
}

void TestFiveNodeScenario() {
  const auto          snapshot = FiveNodeScenario();
  DependencyAnalytics engine(*snapshot);

  const auto bottlenecks = engine.FindBottlenecks(1);
  assert(bottlenecks.size() == 1);
  assert(bottlenecks[0].id == "A");
  assert(bottlenecks[0].blocks_count == 2);
  assert(bottlenecks[0].transitive_count == 3);
  // B + C direct, half of D transitively
  assert(bottlenecks[0].impact_score == 5.0);
  assert((bottlenecks[0].blocked_tasks == std::vector<std::string>{"B", "C"}));

  const auto parallel = engine.GetParallelWork();
  assert((parallel.ready_now == std::vector<std::string>{"A", "E"}));
  assert(parallel.total_ready == 2);
  assert(parallel.level_count == 3);
  assert((parallel.next_level == std::vector<std::string>{"B", "C"}));
  assert(parallel.max_parallelism == 2);
  assert(parallel.cycle_members.empty());
  assert(parallel.unassigned.empty());
  assert(parallel.suggested_assignments.size() == 2);
  assert((parallel.suggested_assignments.at("agent-1") == std::vector<std::string>{"A"}));
  assert((parallel.suggested_assignments.at("agent-2") == std::vector<std::string>{"E"}));

  const auto risks = engine.AssessRisks(2);
  assert(risks.high_risk_tasks.size() == 1);
  assert(risks.high_risk_tasks[0].id == "A");
  assert(risks.high_risk_tasks[0].risk_score == 8.0);
  assert((risks.orphaned_tasks == std::vector<std::string>{"E"}));
  assert(risks.circular_dependencies.empty());
  assert(risks.recommendations.size() == 1);
  assert(risks.recommendations[0] == "Prioritize A (task A): it blocks 2 tasks");

  const auto impact = engine.AnalyzeImpact("A");
  assert(impact.direct_dependents == 2);
  assert(impact.total_impact == 3);
  assert(impact.completion_impact == 75.0);
  assert((impact.affected_nodes == std::vector<std::string>{"B", "C", "D"}));
}

void TestRecommendationsRankReadyWork() {
  const auto          snapshot = FiveNodeScenario();
  DependencyAnalytics engine(*snapshot);

  const auto result = engine.RecommendNextWork(2);
  assert(result.recommendations.size() == 2);
  assert(result.recommendations[0].id == "A");
  assert(result.recommendations[0].score == 44.0);
  assert(result.recommendations[0].unlocks_count == 2);
  assert(Contains(result.recommendations[0].reasons, "high priority"));
  assert(Contains(result.recommendations[0].reasons, "ready to start now"));
  assert(result.recommendations[1].id == "E");
  assert(result.recommendations[1].score == 20.0);
  assert((result.parallel_batch == std::vector<std::string>{"A", "E"}));

  bool threw = false;
  try {
    (void)engine.RecommendNextWork(0);
  } catch (const workgraph::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRecommendationReasonsAndEffortPenalty() {
  GraphSnapshotBuilder builder;
  auto                 hub   = Item("hub", Priority::kLow);
  hub.estimated_effort_hours = 2.0;
  auto slow                  = Item("slow", Priority::kLow);
  slow.estimated_effort_hours = 40.0;
  builder.AddNode(hub).AddNode(slow).AddNode(Item("x")).AddNode(Item("y")).AddNode(Item("z"));
  builder.Blocks("hub", "x").Blocks("hub", "y").Blocks("hub", "z");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);
  const auto          result = engine.RecommendNextWork(1, 5);

  assert(result.recommendations.size() == 2);
  const auto& top = result.recommendations[0];
  assert(top.id == "hub");
  // 10 * 1 + 2 * 3 - 2 / 4
  assert(top.score == 15.5);
  assert(Contains(top.reasons, "unblocks 3 tasks"));
  assert(Contains(top.reasons, "quick win"));
  assert(!Contains(top.reasons, "high priority"));

  const auto& last = result.recommendations[1];
  assert(last.id == "slow");
  // penalty capped at 5
  assert(last.score == 5.0);
  assert(!Contains(last.reasons, "quick win"));
  assert((result.parallel_batch == std::vector<std::string>{"hub"}));
}

void TestCycleRoundTrip() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A")).AddNode(Item("B")).AddNode(Item("C")).AddNode(Item("X"));
  builder.Blocks("A", "B").Blocks("B", "C").Blocks("C", "A").Blocks("C", "X");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto risks = engine.AssessRisks();
  assert(risks.circular_dependencies.size() == 1);
  assert((risks.circular_dependencies[0] == std::vector<std::string>{"A", "B", "C"}));
  assert(Contains(risks.recommendations, "Break circular dependency: A -> B -> C -> A"));

  const auto parallel = engine.GetParallelWork();
  assert(parallel.levels.empty());
  assert(parallel.ready_now.empty());
  assert((parallel.cycle_members == std::vector<std::string>{"A", "B", "C"}));
  assert((parallel.unassigned == std::vector<std::string>{"X"}));

  // cycles terminate the closure too
  const auto impact = engine.AnalyzeImpact("A");
  assert((impact.affected_nodes == std::vector<std::string>{"B", "C", "X"}));
}

void TestCyclesSharingAJoinAreAllReported() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A")).AddNode(Item("B")).AddNode(Item("C")).AddNode(Item("D"));
  builder.Blocks("A", "B").Blocks("A", "C").Blocks("B", "D").Blocks("C", "D").Blocks("D", "A");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto risks = engine.AssessRisks();
  assert(risks.circular_dependencies.size() == 2);
  assert((risks.circular_dependencies[0] == std::vector<std::string>{"A", "B", "D"}));
  assert((risks.circular_dependencies[1] == std::vector<std::string>{"A", "C", "D"}));
  assert(Contains(risks.recommendations, "Break circular dependency: A -> C -> D -> A"));

  // every node held back as a cycle member shows up in a reported cycle
  const auto parallel = engine.GetParallelWork();
  assert((parallel.cycle_members == std::vector<std::string>{"A", "B", "C", "D"}));
  for (const auto& id : parallel.cycle_members) {
    bool reported = false;
    for (const auto& cycle : risks.circular_dependencies) {
      reported = reported || Contains(cycle, id);
    }
    assert(reported);
  }
}

void TestLayeringIsComplete() {
  GraphSnapshotBuilder builder;
  for (const auto* id : {"a", "b", "c", "d", "e", "f", "g"}) {
    builder.AddNode(Item(id));
  }
  builder.Blocks("a", "c").Blocks("b", "c").Blocks("c", "d").Blocks("a", "e").Blocks("e", "f").Blocks("d", "f");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);
  const auto          parallel = engine.GetParallelWork(2);

  std::set<std::string> seen;
  for (std::size_t layer = 0; layer < parallel.levels.size(); ++layer) {
    for (const auto& id : parallel.levels[layer]) {
      assert(seen.insert(id).second);
      for (const auto& blocker : snapshot->Backward(id)) {
        bool earlier = false;
        for (std::size_t prior = 0; prior < layer; ++prior) {
          earlier = earlier || Contains(parallel.levels[prior], blocker);
        }
        assert(earlier);
      }
    }
  }
  assert(seen.size() == snapshot->NodeCount());
  assert((parallel.ready_now == std::vector<std::string>{"a", "b", "g"}));
  assert(parallel.level_count == 4);
  assert(parallel.max_parallelism == 2);
}

void TestDoneBlockersAreResolved() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A", Priority::kHigh, Status::kDone)).AddNode(Item("B")).AddNode(Item("C"));
  builder.Blocks("A", "B").Blocks("B", "C");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto parallel = engine.GetParallelWork();
  assert((parallel.ready_now == std::vector<std::string>{"B"}));

  const auto bottlenecks = engine.FindBottlenecks();
  assert(bottlenecks.size() == 1);
  assert(bottlenecks[0].id == "B");

  const auto impact = engine.AnalyzeImpact("B");
  // two non-done nodes remain
  assert(impact.completion_impact == 100.0);
}

void TestDoneNodesPassThroughTransitiveReach() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A")).AddNode(Item("D", Priority::kMedium, Status::kDone)).AddNode(Item("C"));
  builder.Blocks("A", "D").Blocks("D", "C");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto bottlenecks = engine.FindBottlenecks();
  assert(bottlenecks.size() == 1);
  assert(bottlenecks[0].id == "A");
  assert(bottlenecks[0].blocks_count == 1);
  assert((bottlenecks[0].blocked_tasks == std::vector<std::string>{"D"}));
  // D is walked through but not counted; C is reached behind it
  assert(bottlenecks[0].transitive_count == 1);
  assert(bottlenecks[0].impact_score == 2.0 + 0.5 * 2.0);

  const auto impact = engine.AnalyzeImpact("A");
  assert(impact.total_impact == 1);
  assert((impact.affected_nodes == std::vector<std::string>{"C"}));
}

void TestStatusFilterLayersInProgressWork() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A", Priority::kMedium, Status::kInProgress)).AddNode(Item("B")).AddNode(Item("C"));
  builder.Blocks("A", "B");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto todo = engine.GetParallelWork();
  assert((todo.ready_now == std::vector<std::string>{"C"}));
  assert((todo.unassigned == std::vector<std::string>{"A", "B"}));

  const auto active = engine.GetParallelWork(5, Status::kInProgress);
  assert((active.ready_now == std::vector<std::string>{"A"}));
}

void TestImpactIsMonotoneAlongChains() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("a")).AddNode(Item("b")).AddNode(Item("c")).AddNode(Item("d"));
  builder.Blocks("a", "b").Blocks("b", "c").Blocks("a", "d");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto a = engine.AnalyzeImpact("a");
  const auto b = engine.AnalyzeImpact("b");
  const auto c = engine.AnalyzeImpact("c");
  assert(a.total_impact >= b.total_impact);
  assert(b.total_impact >= c.total_impact);
  assert(c.total_impact == 0);
  assert(c.completion_impact == 0.0);

  bool threw = false;
  try {
    (void)engine.AnalyzeImpact("missing");
  } catch (const workgraph::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBottleneckOrderingIsStable() {
  GraphSnapshotBuilder builder;
  for (const auto* id : {"w", "x", "y", "z", "hub", "t1", "t2", "t3"}) {
    builder.AddNode(Item(id));
  }
  builder.Blocks("x", "y").Blocks("w", "z").Blocks("hub", "t1").Blocks("hub", "t2").Blocks("t2", "t3");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto first = engine.FindBottlenecks(10);
  std::vector<std::string> order;
  for (const auto& bottleneck : first) {
    order.push_back(bottleneck.id);
  }
  // hub 5.0; t2 2.0 / w 2.0 / x 2.0 tie on impact and transitive count
  assert((order == std::vector<std::string>{"hub", "t2", "w", "x"}));

  for (int i = 0; i < 5; ++i) {
    const auto again = engine.FindBottlenecks(10);
    assert(again.size() == first.size());
    for (std::size_t j = 0; j < again.size(); ++j) {
      assert(again[j].id == first[j].id);
    }
  }

  assert(engine.FindBottlenecks(10, 2).size() == 1);
}

void TestWorkQueueOrdering() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("A", Priority::kMedium, Status::kInProgress)).AddNode(Item("B", Priority::kCritical)).AddNode(Item("C"));
  builder.AddNode(Item("D", Priority::kLow, Status::kDone));
  builder.Blocks("A", "B");

  const auto          snapshot = builder.Build();
  DependencyAnalytics engine(*snapshot);

  const auto queue = engine.GetWorkQueue();
  assert(queue.size() == 2);
  assert(queue[0].id == "C" && queue[0].ready);
  assert(queue[1].id == "A" && !queue[1].ready);

  const auto full = engine.GetWorkQueue(10, true);
  assert(full.size() == 3);
  assert(full[2].id == "B");
  assert((full[2].blocked_by == std::vector<std::string>{"A"}));

  assert(engine.GetWorkQueue(1, true).size() == 1);
}

void TestCustomWeights() {
  workgraph::analytics::AnalyticsWeights weights;
  weights.medium            = 5.0;
  weights.transitive_factor = 0.0;

  const auto          snapshot = FiveNodeScenario();
  DependencyAnalytics engine(*snapshot, weights);

  const auto bottlenecks = engine.FindBottlenecks(1);
  assert(bottlenecks[0].impact_score == 10.0);
}

void TestExpiredDeadlineAbortsAnalysis() {
  const auto snapshot = FiveNodeScenario();
  const auto expired  = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);

  DependencyAnalytics engine(*snapshot, {}, expired);

  bool threw = false;
  try {
    (void)engine.FindBottlenecks();
  } catch (const workgraph::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)engine.GetParallelWork();
  } catch (const workgraph::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFiveNodeScenario();
  TestRecommendationsRankReadyWork();
  TestRecommendationReasonsAndEffortPenalty();
  TestCycleRoundTrip();
  TestCyclesSharingAJoinAreAllReported();
  TestLayeringIsComplete();
  TestDoneBlockersAreResolved();
  TestDoneNodesPassThroughTransitiveReach();
  TestStatusFilterLayersInProgressWork();
  TestImpactIsMonotoneAlongChains();
  TestBottleneckOrderingIsStable();
  TestWorkQueueOrdering();
  TestCustomWeights();
  TestExpiredDeadlineAbortsAnalysis();

  std::cout << "workgraph_unit_dependency_analytics: pass\n";
  return 0;
}
