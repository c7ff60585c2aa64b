#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"

namespace workgraph::graph {

using IdSet = std::set<std::string>;

/*
  GraphSnapshot

  Immutable point-in-time adjacency view used by analytics.

    nodes:    id -> WorkItem
    forward:  id -> ids it blocks
    backward: id -> ids blocking it

  forward/backward carry blocks edges only. parent_of edges are kept apart
  (children / hierarchy membership) and never take part in dependency
  algorithms.

  Shared read-only between threads through shared_ptr<const GraphSnapshot>.
*/
class GraphSnapshot {
 public:
  const std::map<std::string, model::WorkItem>& Nodes() const {
    return nodes_;
  }

  // nullptr when absent
  const model::WorkItem* Find(const std::string& id) const;

  // Throws util::NotFound when absent.
  const model::WorkItem& Get(const std::string& id) const;

  bool Contains(const std::string& id) const {
    return nodes_.contains(id);
  }

  // Empty set for unknown ids or ids without edges.
  const IdSet& Forward(const std::string& id) const;
  const IdSet& Backward(const std::string& id) const;
  const IdSet& Children(const std::string& id) const;

  // True when id is the source or target of any parent_of edge.
  bool InHierarchy(const std::string& id) const {
    return hierarchy_members_.contains(id);
  }

  std::vector<model::Edge> BlocksEdges() const;
  std::vector<model::Edge> ParentOfEdges() const;

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  std::size_t BlocksEdgeCount() const {
    return blocks_edge_count_;
  }

  // Index version this snapshot was cut at (0 for hand-built snapshots).
  uint64_t Version() const {
    return version_;
  }

 private:
  friend class GraphSnapshotBuilder;

  GraphSnapshot() = default;

  static const IdSet& Lookup(const std::map<std::string, IdSet>& adjacency, const std::string& id);

  std::map<std::string, model::WorkItem> nodes_;
  std::map<std::string, IdSet>           forward_;
  std::map<std::string, IdSet>           backward_;
  std::map<std::string, IdSet>           children_;
  IdSet                                  hierarchy_members_;
  std::size_t                            blocks_edge_count_ = 0;
  uint64_t                               version_           = 0;
};

/*
  Collects nodes and edges, then materializes a GraphSnapshot.

  Build() rejects dangling edges with util::ValidationError. Duplicate
  edges collapse.
*/
class GraphSnapshotBuilder {
 public:
  GraphSnapshotBuilder& AddNode(model::WorkItem item);
  GraphSnapshotBuilder& AddEdge(model::Edge edge);

  // Convenience for tests and fixtures.
  GraphSnapshotBuilder& Blocks(const std::string& from_id, const std::string& to_id) {
    return AddEdge(model::Edge{from_id, to_id, model::EdgeKind::kBlocks});
  }

  GraphSnapshotBuilder& ParentOf(const std::string& parent_id, const std::string& child_id) {
    return AddEdge(model::Edge{parent_id, child_id, model::EdgeKind::kParentOf});
  }

  std::shared_ptr<const GraphSnapshot> Build(uint64_t version = 0);

 private:
  std::map<std::string, model::WorkItem> nodes_;
  std::set<model::Edge>                  edges_;
};

} // namespace workgraph::graph
