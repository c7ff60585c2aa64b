#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/work_item_server.hpp"
#include "internal/util/errors.hpp"
#include "workgraph/v1.hpp"

namespace {

using namespace workgraph::v1;

workgraph::factory::Application BuildApp() {
  return workgraph::factory::Build(workgraph::config::ConfigLoader::LoadFromYamlString("{}"));
}

void TestExceptionMapping() {
  using workgraph::grpc::ToStatus;
  assert(ToStatus(workgraph::util::ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(workgraph::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(workgraph::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(workgraph::util::IndexInconsistent("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(workgraph::db::TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(workgraph::util::DeadlineExceeded("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestWorkItemServerStatuses() {
  auto                           app = BuildApp();
  workgraph::grpc::WorkItemServer server(app.work_item_service);
  ::grpc::ServerContext          grpc_ctx;

  CreateWorkItemRequest create;
  create.set_id("a");
  create.set_title("first");
  CreateWorkItemResponse created;
  assert(server.CreateWorkItem(&grpc_ctx, &create, &created).ok());
  assert(created.item().id() == "a");

  CreateWorkItemResponse duplicate;
  assert(server.CreateWorkItem(&grpc_ctx, &create, &duplicate).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  GetWorkItemRequest get;
  get.set_id("missing");
  GetWorkItemResponse fetched;
  assert(server.GetWorkItem(&grpc_ctx, &get, &fetched).error_code() == ::grpc::StatusCode::NOT_FOUND);

  AddEdgeRequest dangling;
  dangling.mutable_edge()->set_from_id("a");
  dangling.mutable_edge()->set_to_id("ghost");
  dangling.mutable_edge()->set_kind(EDGE_KIND_BLOCKS);
  AddEdgeResponse added;
  assert(server.AddEdge(&grpc_ctx, &dangling, &added).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestAnalyticsAndAdminServers() {
  auto                             app = BuildApp();
  workgraph::grpc::AnalyticsServer analytics(app.analytics_service);
  workgraph::grpc::AdminServer     admin(app.admin_service);
  ::grpc::ServerContext            grpc_ctx;

  AnalyzeImpactRequest impact;
  impact.set_node_id("missing");
  AnalyzeImpactResponse impact_resp;
  assert(analytics.AnalyzeImpact(&grpc_ctx, &impact, &impact_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  FindBottlenecksRequest bottlenecks;
  FindBottlenecksResponse bottlenecks_resp;
  assert(analytics.FindBottlenecks(&grpc_ctx, &bottlenecks, &bottlenecks_resp).ok());
  assert(bottlenecks_resp.bottlenecks_size() == 0);

  RebuildIndexRequest rebuild;
  RebuildIndexResponse rebuild_resp;
  assert(admin.RebuildIndex(&grpc_ctx, &rebuild, &rebuild_resp).ok());
  assert(rebuild_resp.stats().rebuild_count() == 1);

  GetIndexStatsRequest stats;
  GetIndexStatsResponse stats_resp;
  assert(admin.GetIndexStats(&grpc_ctx, &stats, &stats_resp).ok());
  assert(stats_resp.stats().rebuild_count() == 1);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestWorkItemServerStatuses();
  TestAnalyticsAndAdminServers();

  std::cout << "workgraph_unit_grpc_status: pass\n";
  return 0;
}
