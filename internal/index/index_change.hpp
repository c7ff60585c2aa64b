#pragma once

#include <string>
#include <variant>

#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"

namespace workgraph::index {

/*
  One Store mutation, as seen by the graph index.
*/

struct UpsertNode {
  model::WorkItem item;
};

struct RemoveNode {
  std::string id;
};

struct AddEdge {
  model::Edge edge;
};

struct RemoveEdge {
  model::Edge edge;
};

using IndexChange = std::variant<UpsertNode, RemoveNode, AddEdge, RemoveEdge>;

// Short human readable form for logs and error messages.
std::string Describe(const IndexChange& change);

} // namespace workgraph::index
