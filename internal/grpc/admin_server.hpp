#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "workgraph/services/v1/admin_service.grpc.pb.h"

namespace workgraph::grpc {

class AdminServer final : public workgraph::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<workgraph::service::AdminService> svc);

  ::grpc::Status RebuildIndex(::grpc::ServerContext*, const workgraph::v1::RebuildIndexRequest*, workgraph::v1::RebuildIndexResponse*) override;

  ::grpc::Status GetIndexStats(::grpc::ServerContext*, const workgraph::v1::GetIndexStatsRequest*, workgraph::v1::GetIndexStatsResponse*) override;

 private:
  std::shared_ptr<workgraph::service::AdminService> service_;
};

} // namespace workgraph::grpc
