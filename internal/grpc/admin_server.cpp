#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace workgraph::grpc {

AdminServer::AdminServer(std::shared_ptr<workgraph::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RebuildIndex(::grpc::ServerContext*, const workgraph::v1::RebuildIndexRequest* req, workgraph::v1::RebuildIndexResponse* resp) {
  return Invoke([&] { *resp = service_->RebuildIndex(*req); });
}

::grpc::Status AdminServer::GetIndexStats(::grpc::ServerContext*, const workgraph::v1::GetIndexStatsRequest* req, workgraph::v1::GetIndexStatsResponse* resp) {
  return Invoke([&] { *resp = service_->GetIndexStats(*req); });
}

} // namespace workgraph::grpc
