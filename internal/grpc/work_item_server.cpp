#include "work_item_server.hpp"

#include "grpc_error.hpp"

namespace workgraph::grpc {

using namespace workgraph::v1;

WorkItemServer::WorkItemServer(std::shared_ptr<workgraph::service::WorkItemService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkItemServer::CreateWorkItem(::grpc::ServerContext*, const CreateWorkItemRequest* req, CreateWorkItemResponse* resp) {
  return Invoke([&] { *resp = service_->CreateWorkItem(*req); });
}

::grpc::Status WorkItemServer::UpdateWorkItem(::grpc::ServerContext*, const UpdateWorkItemRequest* req, UpdateWorkItemResponse* resp) {
  return Invoke([&] { *resp = service_->UpdateWorkItem(*req); });
}

::grpc::Status WorkItemServer::DeleteWorkItem(::grpc::ServerContext*, const DeleteWorkItemRequest* req, DeleteWorkItemResponse* resp) {
  return Invoke([&] { *resp = service_->DeleteWorkItem(*req); });
}

::grpc::Status WorkItemServer::GetWorkItem(::grpc::ServerContext*, const GetWorkItemRequest* req, GetWorkItemResponse* resp) {
  return Invoke([&] { *resp = service_->GetWorkItem(*req); });
}

::grpc::Status WorkItemServer::ListWorkItems(::grpc::ServerContext*, const ListWorkItemsRequest* req, ListWorkItemsResponse* resp) {
  return Invoke([&] { *resp = service_->ListWorkItems(*req); });
}

::grpc::Status WorkItemServer::AddEdge(::grpc::ServerContext*, const AddEdgeRequest* req, AddEdgeResponse* resp) {
  return Invoke([&] { *resp = service_->AddEdge(*req); });
}

::grpc::Status WorkItemServer::RemoveEdge(::grpc::ServerContext*, const RemoveEdgeRequest* req, RemoveEdgeResponse* resp) {
  return Invoke([&] { *resp = service_->RemoveEdge(*req); });
}

} // namespace workgraph::grpc
