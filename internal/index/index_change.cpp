#include "internal/index/index_change.hpp"

#include <type_traits>

namespace workgraph::index {

namespace {

std::string DescribeEdge(const model::Edge& edge) {
  return edge.from_id + " -" + std::string(model::ToString(edge.kind)) + "-> " + edge.to_id;
}

} // namespace

std::string Describe(const IndexChange& change) {
  return std::visit(
      [](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, UpsertNode>) {
          return "upsert node " + c.item.id;
        } else if constexpr (std::is_same_v<T, RemoveNode>) {
          return "remove node " + c.id;
        } else if constexpr (std::is_same_v<T, AddEdge>) {
          return "add edge " + DescribeEdge(c.edge);
        } else {
          return "remove edge " + DescribeEdge(c.edge);
        }
      },
      change);
}

} // namespace workgraph::index
