#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "workgraph/v1.hpp"

namespace {

using namespace workgraph::v1;

workgraph::factory::Application BuildApp() {
  const auto config = workgraph::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
index:
  shard_count: 4
)");
  return workgraph::factory::Build(config);
}

std::string Create(workgraph::factory::Application& app, const std::string& id, Priority priority = PRIORITY_MEDIUM) {
  CreateWorkItemRequest req;
  req.set_id(id);
  req.set_title("task " + id);
  req.set_priority(priority);
  return app.work_item_service->CreateWorkItem(req).item().id();
}

void Block(workgraph::factory::Application& app, const std::string& from, const std::string& to) {
  AddEdgeRequest req;
  req.mutable_edge()->set_from_id(from);
  req.mutable_edge()->set_to_id(to);
  req.mutable_edge()->set_kind(EDGE_KIND_BLOCKS);
  app.work_item_service->AddEdge(req);
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestWorkItemCrud() {
  auto app = BuildApp();

  CreateWorkItemRequest create;
  create.set_title("Generated id");
  create.set_item_type(ITEM_TYPE_EPIC);
  create.set_estimated_effort_hours(6.5);
  const auto created = app.work_item_service->CreateWorkItem(create).item();
  assert(created.id().rfind("epic-", 0) == 0);
  assert(created.status() == WORK_ITEM_STATUS_TODO);
  assert(created.priority() == PRIORITY_MEDIUM);
  assert(created.has_estimated_effort_hours());
  assert(created.estimated_effort_hours() == 6.5);

  Create(app, "a");
  Block(app, created.id(), "a");

  UpdateWorkItemRequest update;
  update.set_id("a");
  update.set_status(WORK_ITEM_STATUS_IN_PROGRESS);
  const auto updated = app.work_item_service->UpdateWorkItem(update).item();
  assert(updated.status() == WORK_ITEM_STATUS_IN_PROGRESS);
  assert(updated.title() == "task a");

  GetWorkItemRequest get;
  get.set_id("a");
  const auto fetched = app.work_item_service->GetWorkItem(get);
  assert(fetched.incoming_size() == 1);
  assert(fetched.incoming(0).from_id() == created.id());
  assert(fetched.outgoing_size() == 0);

  ListWorkItemsRequest list;
  assert(app.work_item_service->ListWorkItems(list).items_size() == 2);
  list.set_status_filter(WORK_ITEM_STATUS_IN_PROGRESS);
  assert(app.work_item_service->ListWorkItems(list).items_size() == 1);

  DeleteWorkItemRequest del;
  del.set_id("a");
  assert(Throws<workgraph::util::ValidationError>([&] { app.work_item_service->DeleteWorkItem(del); }));

  RemoveEdgeRequest remove;
  remove.mutable_edge()->set_from_id(created.id());
  remove.mutable_edge()->set_to_id("a");
  remove.mutable_edge()->set_kind(EDGE_KIND_BLOCKS);
  app.work_item_service->RemoveEdge(remove);
  app.work_item_service->DeleteWorkItem(del);

  assert(Throws<workgraph::util::NotFound>([&] { app.work_item_service->GetWorkItem(get); }));
}

void TestRequestValidation() {
  auto app = BuildApp();

  AddEdgeRequest edge;
  edge.mutable_edge()->set_from_id("x");
  edge.mutable_edge()->set_to_id("y");
  assert(Throws<workgraph::util::ValidationError>([&] { app.work_item_service->AddEdge(edge); }));

  UpdateWorkItemRequest update;
  update.set_id("x");
  update.set_priority(static_cast<Priority>(42));
  assert(Throws<workgraph::util::ValidationError>([&] { app.work_item_service->UpdateWorkItem(update); }));

  AnalyzeImpactRequest impact;
  assert(Throws<workgraph::util::ValidationError>([&] { app.analytics_service->AnalyzeImpact(impact); }));
}

void TestAnalyticsOverFiveNodeScenario() {
  auto app = BuildApp();
  Create(app, "A", PRIORITY_CRITICAL);
  for (const auto* id : {"B", "C", "D", "E"}) {
    Create(app, id);
  }
  Block(app, "A", "B");
  Block(app, "A", "C");
  Block(app, "B", "D");

  FindBottlenecksRequest bottlenecks_req;
  bottlenecks_req.set_top_n(1);
  const auto bottlenecks = app.analytics_service->FindBottlenecks(bottlenecks_req);
  assert(bottlenecks.bottlenecks_size() == 1);
  assert(bottlenecks.bottlenecks(0).id() == "A");
  assert(bottlenecks.bottlenecks(0).blocks_count() == 2);
  assert(bottlenecks.snapshot_version() == app.index->Version());

  // without min_impact only nodes that block something qualify
  bottlenecks_req.set_top_n(10);
  assert(app.analytics_service->FindBottlenecks(bottlenecks_req).bottlenecks_size() == 2);

  bottlenecks_req.set_min_impact(0);
  const auto everything = app.analytics_service->FindBottlenecks(bottlenecks_req);
  assert(everything.bottlenecks_size() == 5);
  assert(everything.bottlenecks(0).id() == "A");
  assert(everything.bottlenecks(1).id() == "B");
  assert(everything.bottlenecks(2).id() == "C");
  assert(everything.bottlenecks(4).id() == "E");
  assert(everything.bottlenecks(4).blocks_count() == 0);

  const auto parallel = app.analytics_service->GetParallelWork(GetParallelWorkRequest{}).parallel_work();
  assert(parallel.ready_now_size() == 2);
  assert(parallel.ready_now(0) == "A");
  assert(parallel.ready_now(1) == "E");
  assert(parallel.levels_size() == 3);
  assert(parallel.suggested_assignments().at("agent-1").ids(0) == "A");

  const auto risks = app.analytics_service->AssessRisks(AssessRisksRequest{}).assessment();
  assert(risks.high_risk_tasks_size() == 1);
  assert(risks.high_risk_tasks(0).id() == "A");
  assert(risks.orphaned_tasks_size() == 1);
  assert(risks.orphaned_tasks(0) == "E");

  RecommendNextWorkRequest recommend_req;
  recommend_req.set_agent_count(2);
  const auto recommendations = app.analytics_service->RecommendNextWork(recommend_req);
  assert(recommendations.recommendations(0).id() == "A");
  assert(recommendations.parallel_batch_size() == 2);

  AnalyzeImpactRequest impact_req;
  impact_req.set_node_id("A");
  const auto impact = app.analytics_service->AnalyzeImpact(impact_req).impact();
  assert(impact.total_impact() == 3);
  assert(impact.completion_impact() == 75.0);

  impact_req.set_node_id("missing");
  assert(Throws<workgraph::util::NotFound>([&] { app.analytics_service->AnalyzeImpact(impact_req); }));

  const auto queue = app.analytics_service->GetWorkQueue(GetWorkQueueRequest{});
  assert(queue.entries_size() == 2);
  assert(queue.entries(0).id() == "A");
}

void TestCallerDeadlineIsHonoured() {
  auto app = BuildApp();
  Create(app, "A");

  const auto expired = std::chrono::steady_clock::now() - std::chrono::seconds(1);
  assert(Throws<workgraph::util::DeadlineExceeded>([&] { app.analytics_service->FindBottlenecks(FindBottlenecksRequest{}, expired); }));
}

void TestAdminRebuildAndStats() {
  auto app = BuildApp();
  Create(app, "a");
  Create(app, "b");
  Block(app, "a", "b");

  const auto before = app.admin_service->GetIndexStats(GetIndexStatsRequest{}).stats();
  assert(before.node_count() == 2);
  assert(before.blocks_edge_count() == 1);
  assert(before.shard_count() == 4);
  assert(before.rebuild_count() == 0);

  const auto rebuilt = app.admin_service->RebuildIndex(RebuildIndexRequest{});
  assert(rebuilt.stats().node_count() == 2);
  assert(rebuilt.stats().blocks_edge_count() == 1);
  assert(rebuilt.stats().rebuild_count() == 1);
  assert(rebuilt.stats().version() > before.version());
  assert(rebuilt.duration_ms() >= 0.0);
}

} // namespace

int main() {
  TestWorkItemCrud();
  TestRequestValidation();
  TestAnalyticsOverFiveNodeScenario();
  TestCallerDeadlineIsHonoured();
  TestAdminRebuildAndStats();

  std::cout << "workgraph_unit_service_layer: pass\n";
  return 0;
}
