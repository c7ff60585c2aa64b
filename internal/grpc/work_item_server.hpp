#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/work_item_service.hpp"
#include "workgraph/services/v1/work_item_service.grpc.pb.h"

namespace workgraph::grpc {

class WorkItemServer final : public workgraph::services::v1::WorkItemService::Service {
 public:
  explicit WorkItemServer(std::shared_ptr<workgraph::service::WorkItemService> svc);

  ::grpc::Status CreateWorkItem(::grpc::ServerContext*, const workgraph::v1::CreateWorkItemRequest*, workgraph::v1::CreateWorkItemResponse*) override;

  ::grpc::Status UpdateWorkItem(::grpc::ServerContext*, const workgraph::v1::UpdateWorkItemRequest*, workgraph::v1::UpdateWorkItemResponse*) override;

  ::grpc::Status DeleteWorkItem(::grpc::ServerContext*, const workgraph::v1::DeleteWorkItemRequest*, workgraph::v1::DeleteWorkItemResponse*) override;

  ::grpc::Status GetWorkItem(::grpc::ServerContext*, const workgraph::v1::GetWorkItemRequest*, workgraph::v1::GetWorkItemResponse*) override;

  ::grpc::Status ListWorkItems(::grpc::ServerContext*, const workgraph::v1::ListWorkItemsRequest*, workgraph::v1::ListWorkItemsResponse*) override;

  ::grpc::Status AddEdge(::grpc::ServerContext*, const workgraph::v1::AddEdgeRequest*, workgraph::v1::AddEdgeResponse*) override;

  ::grpc::Status RemoveEdge(::grpc::ServerContext*, const workgraph::v1::RemoveEdgeRequest*, workgraph::v1::RemoveEdgeResponse*) override;

 private:
  std::shared_ptr<workgraph::service::WorkItemService> service_;
};

} // namespace workgraph::grpc
