#pragma once

#include "internal/service/service_context.hpp"
#include "workgraph/v1.hpp"

namespace workgraph::service {

/*
  Write and lookup path for individual work items and their edges.
*/
class WorkItemService {
 public:
  explicit WorkItemService(ServiceContext ctx);

  workgraph::v1::CreateWorkItemResponse CreateWorkItem(const workgraph::v1::CreateWorkItemRequest& req);
  workgraph::v1::UpdateWorkItemResponse UpdateWorkItem(const workgraph::v1::UpdateWorkItemRequest& req);
  workgraph::v1::DeleteWorkItemResponse DeleteWorkItem(const workgraph::v1::DeleteWorkItemRequest& req);
  workgraph::v1::GetWorkItemResponse    GetWorkItem(const workgraph::v1::GetWorkItemRequest& req);
  workgraph::v1::ListWorkItemsResponse  ListWorkItems(const workgraph::v1::ListWorkItemsRequest& req);
  workgraph::v1::AddEdgeResponse        AddEdge(const workgraph::v1::AddEdgeRequest& req);
  workgraph::v1::RemoveEdgeResponse     RemoveEdge(const workgraph::v1::RemoveEdgeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace workgraph::service
