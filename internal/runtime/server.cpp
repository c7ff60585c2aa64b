#include "server.hpp"

#include <stdexcept>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/analytics_server.hpp"
#include "internal/grpc/work_item_server.hpp"
#include "internal/observability/logging.hpp"

namespace workgraph::runtime {

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const workgraph::factory::Application& app) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<workgraph::grpc::WorkItemServer>(app.work_item_service));
  services.push_back(std::make_unique<workgraph::grpc::AnalyticsServer>(app.analytics_service));
  services.push_back(std::make_unique<workgraph::grpc::AdminServer>(app.admin_service));
  return services;
}

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  WORKGRAPH_LOG_INFO("gRPC server listening", {workgraph::observability::StringField("bind_address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace workgraph::runtime
