#include "work_item_service.hpp"

#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/store/work_item_store.hpp"
#include "internal/util/errors.hpp"

namespace workgraph::service {

using namespace workgraph::v1;

namespace {

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::ValidationError("id is required");
  }
}

} // namespace

WorkItemService::WorkItemService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateWorkItemResponse WorkItemService::CreateWorkItem(const CreateWorkItemRequest& req) {
  return ObserveRpc("WorkItemService.CreateWorkItem", req.id(), [&] {
    model::WorkItem item;
    item.id        = req.id();
    item.title     = req.title();
    item.priority  = OptionalPriority(req.priority()).value_or(model::Priority::kMedium);
    item.item_type = OptionalItemType(req.item_type()).value_or(model::ItemType::kFeature);
    if (req.has_estimated_effort_hours()) {
      item.estimated_effort_hours = req.estimated_effort_hours();
    }

    CreateWorkItemResponse resp;
    *resp.mutable_item() = ToProto(ctx_.store->CreateItem(std::move(item)));
    return resp;
  });
}

UpdateWorkItemResponse WorkItemService::UpdateWorkItem(const UpdateWorkItemRequest& req) {
  return ObserveRpc("WorkItemService.UpdateWorkItem", req.id(), [&] {
    RequireId(req.id());

    store::WorkItemPatch patch;
    if (req.has_title()) patch.title = req.title();
    patch.status    = OptionalStatus(req.status());
    patch.priority  = OptionalPriority(req.priority());
    patch.item_type = OptionalItemType(req.item_type());
    if (req.has_estimated_effort_hours()) patch.estimated_effort_hours = req.estimated_effort_hours();
    patch.clear_estimated_effort = req.clear_estimated_effort();

    UpdateWorkItemResponse resp;
    *resp.mutable_item() = ToProto(ctx_.store->UpdateItem(req.id(), patch));
    return resp;
  });
}

DeleteWorkItemResponse WorkItemService::DeleteWorkItem(const DeleteWorkItemRequest& req) {
  return ObserveRpc("WorkItemService.DeleteWorkItem", req.id(), [&] {
    RequireId(req.id());
    ctx_.store->DeleteItem(req.id());
    return DeleteWorkItemResponse{};
  });
}

GetWorkItemResponse WorkItemService::GetWorkItem(const GetWorkItemRequest& req) {
  return ObserveRpc("WorkItemService.GetWorkItem", req.id(), [&] {
    RequireId(req.id());

    GetWorkItemResponse resp;
    *resp.mutable_item() = ToProto(ctx_.store->GetItem(req.id()));
    for (const auto& edge : ctx_.store->GetOutgoing(req.id())) {
      *resp.add_outgoing() = ToProto(edge);
    }
    for (const auto& edge : ctx_.store->GetIncoming(req.id())) {
      *resp.add_incoming() = ToProto(edge);
    }
    return resp;
  });
}

ListWorkItemsResponse WorkItemService::ListWorkItems(const ListWorkItemsRequest& req) {
  return ObserveRpc("WorkItemService.ListWorkItems", "", [&] {
    const auto filter = OptionalStatus(req.status_filter());

    ListWorkItemsResponse resp;
    for (const auto& item : ctx_.store->ListItems()) {
      if (filter && item.status != *filter) {
        continue;
      }
      *resp.add_items() = ToProto(item);
    }
    return resp;
  });
}

AddEdgeResponse WorkItemService::AddEdge(const AddEdgeRequest& req) {
  return ObserveRpc("WorkItemService.AddEdge", req.edge().from_id(), [&] {
    ctx_.store->AddEdge(EdgeFromProto(req.edge()));
    return AddEdgeResponse{};
  });
}

RemoveEdgeResponse WorkItemService::RemoveEdge(const RemoveEdgeRequest& req) {
  return ObserveRpc("WorkItemService.RemoveEdge", req.edge().from_id(), [&] {
    ctx_.store->RemoveEdge(EdgeFromProto(req.edge()));
    return RemoveEdgeResponse{};
  });
}

} // namespace workgraph::service
