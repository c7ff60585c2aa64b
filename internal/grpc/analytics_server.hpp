#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/analytics_service.hpp"
#include "workgraph/services/v1/analytics_service.grpc.pb.h"

namespace workgraph::grpc {

/*
  Forwards the client deadline of each call into the analytics engine so a
  long analysis stops with DEADLINE_EXCEEDED instead of running on.
*/
class AnalyticsServer final : public workgraph::services::v1::AnalyticsService::Service {
 public:
  explicit AnalyticsServer(std::shared_ptr<workgraph::service::AnalyticsService> svc);

  ::grpc::Status FindBottlenecks(::grpc::ServerContext*, const workgraph::v1::FindBottlenecksRequest*, workgraph::v1::FindBottlenecksResponse*) override;

  ::grpc::Status GetParallelWork(::grpc::ServerContext*, const workgraph::v1::GetParallelWorkRequest*, workgraph::v1::GetParallelWorkResponse*) override;

  ::grpc::Status RecommendNextWork(::grpc::ServerContext*, const workgraph::v1::RecommendNextWorkRequest*,
                                   workgraph::v1::RecommendNextWorkResponse*) override;

  ::grpc::Status AssessRisks(::grpc::ServerContext*, const workgraph::v1::AssessRisksRequest*, workgraph::v1::AssessRisksResponse*) override;

  ::grpc::Status AnalyzeImpact(::grpc::ServerContext*, const workgraph::v1::AnalyzeImpactRequest*, workgraph::v1::AnalyzeImpactResponse*) override;

  ::grpc::Status GetWorkQueue(::grpc::ServerContext*, const workgraph::v1::GetWorkQueueRequest*, workgraph::v1::GetWorkQueueResponse*) override;

 private:
  std::shared_ptr<workgraph::service::AnalyticsService> service_;
};

} // namespace workgraph::grpc
