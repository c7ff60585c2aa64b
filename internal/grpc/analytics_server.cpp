#include "analytics_server.hpp"

#include <chrono>
#include <optional>

#include "grpc_error.hpp"

namespace workgraph::grpc {

using namespace workgraph::v1;

namespace {

// Client deadlines arrive on the system clock; the engine checks a steady one.
std::optional<workgraph::service::AnalyticsService::Deadline> CallDeadline(const ::grpc::ServerContext* context) {
  if (context == nullptr) {
    return std::nullopt;
  }
  const auto deadline = context->deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) {
    return std::nullopt;
  }
  const auto remaining = deadline - std::chrono::system_clock::now();
  return std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(remaining);
}

} // namespace

AnalyticsServer::AnalyticsServer(std::shared_ptr<workgraph::service::AnalyticsService> svc) : service_(std::move(svc)) {
}

::grpc::Status AnalyticsServer::FindBottlenecks(::grpc::ServerContext* context, const FindBottlenecksRequest* req, FindBottlenecksResponse* resp) {
  return Invoke([&] { *resp = service_->FindBottlenecks(*req, CallDeadline(context)); });
}

::grpc::Status AnalyticsServer::GetParallelWork(::grpc::ServerContext* context, const GetParallelWorkRequest* req, GetParallelWorkResponse* resp) {
  return Invoke([&] { *resp = service_->GetParallelWork(*req, CallDeadline(context)); });
}

::grpc::Status AnalyticsServer::RecommendNextWork(::grpc::ServerContext* context, const RecommendNextWorkRequest* req, RecommendNextWorkResponse* resp) {
  return Invoke([&] { *resp = service_->RecommendNextWork(*req, CallDeadline(context)); });
}

::grpc::Status AnalyticsServer::AssessRisks(::grpc::ServerContext* context, const AssessRisksRequest* req, AssessRisksResponse* resp) {
  return Invoke([&] { *resp = service_->AssessRisks(*req, CallDeadline(context)); });
}

::grpc::Status AnalyticsServer::AnalyzeImpact(::grpc::ServerContext* context, const AnalyzeImpactRequest* req, AnalyzeImpactResponse* resp) {
  return Invoke([&] { *resp = service_->AnalyzeImpact(*req, CallDeadline(context)); });
}

::grpc::Status AnalyticsServer::GetWorkQueue(::grpc::ServerContext* context, const GetWorkQueueRequest* req, GetWorkQueueResponse* resp) {
  return Invoke([&] { *resp = service_->GetWorkQueue(*req, CallDeadline(context)); });
}

} // namespace workgraph::grpc
