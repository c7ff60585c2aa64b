#include "internal/graph/graph_snapshot.hpp"

#include "internal/util/errors.hpp"

namespace workgraph::graph {

const model::WorkItem* GraphSnapshot::Find(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const model::WorkItem& GraphSnapshot::Get(const std::string& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw util::NotFound("work item not found: " + id);
  }
  return it->second;
}

const IdSet& GraphSnapshot::Lookup(const std::map<std::string, IdSet>& adjacency, const std::string& id) {
  static const IdSet kEmpty;
  auto               it = adjacency.find(id);
  return it == adjacency.end() ? kEmpty : it->second;
}

const IdSet& GraphSnapshot::Forward(const std::string& id) const {
  return Lookup(forward_, id);
}

const IdSet& GraphSnapshot::Backward(const std::string& id) const {
  return Lookup(backward_, id);
}

const IdSet& GraphSnapshot::Children(const std::string& id) const {
  return Lookup(children_, id);
}

std::vector<model::Edge> GraphSnapshot::BlocksEdges() const {
  std::vector<model::Edge> edges;
  edges.reserve(blocks_edge_count_);
  for (const auto& [from, targets] : forward_) {
    for (const auto& to : targets) {
      edges.push_back(model::Edge{from, to, model::EdgeKind::kBlocks});
    }
  }
  return edges;
}

std::vector<model::Edge> GraphSnapshot::ParentOfEdges() const {
  std::vector<model::Edge> edges;
  for (const auto& [parent, children] : children_) {
    for (const auto& child : children) {
      edges.push_back(model::Edge{parent, child, model::EdgeKind::kParentOf});
    }
  }
  return edges;
}

// ------------------------------------------------------------
// Builder
// ------------------------------------------------------------

GraphSnapshotBuilder& GraphSnapshotBuilder::AddNode(model::WorkItem item) {
  auto id = item.id;
  nodes_.insert_or_assign(std::move(id), std::move(item));
  return *this;
}

GraphSnapshotBuilder& GraphSnapshotBuilder::AddEdge(model::Edge edge) {
  edges_.insert(std::move(edge));
  return *this;
}

std::shared_ptr<const GraphSnapshot> GraphSnapshotBuilder::Build(uint64_t version) {
  // private constructor: cannot go through make_shared
  std::shared_ptr<GraphSnapshot> snapshot(new GraphSnapshot());

  for (const auto& edge : edges_) {
    if (!nodes_.contains(edge.from_id) || !nodes_.contains(edge.to_id)) {
      throw util::ValidationError("dangling edge " + edge.from_id + " -" + std::string(model::ToString(edge.kind)) + "-> " + edge.to_id);
    }

    switch (edge.kind) {
      case model::EdgeKind::kBlocks:
        snapshot->forward_[edge.from_id].insert(edge.to_id);
        snapshot->backward_[edge.to_id].insert(edge.from_id);
        ++snapshot->blocks_edge_count_;
        break;
      case model::EdgeKind::kParentOf:
        snapshot->children_[edge.from_id].insert(edge.to_id);
        snapshot->hierarchy_members_.insert(edge.from_id);
        snapshot->hierarchy_members_.insert(edge.to_id);
        break;
    }
  }

  snapshot->nodes_   = std::move(nodes_);
  snapshot->version_ = version;
  nodes_.clear();
  edges_.clear();
  return snapshot;
}

} // namespace workgraph::graph
