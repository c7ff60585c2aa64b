#include "admin_service.hpp"

#include <chrono>

#include "internal/index/graph_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/store/work_item_store.hpp"

namespace workgraph::service {

using namespace workgraph::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RebuildIndexResponse AdminService::RebuildIndex(const RebuildIndexRequest&) {
  return ObserveRpc("AdminService.RebuildIndex", "", [&] {
    const auto started_at = std::chrono::steady_clock::now();
    ctx_.store->RebuildIndex();
    const double duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();

    const auto stats = ctx_.index->Stats();
    WORKGRAPH_LOG_INFO("Index rebuilt", {workgraph::observability::IntField("nodes", static_cast<int64_t>(stats.node_count)),
                                         workgraph::observability::IntField("version", static_cast<int64_t>(stats.version)),
                                         workgraph::observability::DoubleField("duration_ms", duration_ms)});

    RebuildIndexResponse resp;
    *resp.mutable_stats() = ToProto(stats);
    resp.set_duration_ms(duration_ms);
    return resp;
  });
}

GetIndexStatsResponse AdminService::GetIndexStats(const GetIndexStatsRequest&) {
  return ObserveRpc("AdminService.GetIndexStats", "", [&] {
    GetIndexStatsResponse resp;
    *resp.mutable_stats() = ToProto(ctx_.index->Stats());
    return resp;
  });
}

} // namespace workgraph::service
