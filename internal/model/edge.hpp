#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace workgraph::model {

/*
  Directed relation between two work items.

  blocks(a -> b):    b cannot start until a is done.
  parent_of(a -> b): hierarchical grouping only, never used for blocking.

  The inverse view (blocked_by) is derived; only the outgoing direction is
  persisted, as part of the source item's document.
*/
enum class EdgeKind : std::uint8_t {
  kBlocks   = 0,
  kParentOf = 1,
};

constexpr std::string_view ToString(EdgeKind kind) {
  switch (kind) {
    case EdgeKind::kBlocks:
      return "blocks";
    case EdgeKind::kParentOf:
      return "parent_of";
  }
  return "blocks";
}

EdgeKind ParseEdgeKind(std::string_view value);

struct Edge {
  std::string from_id;
  std::string to_id;
  EdgeKind    kind = EdgeKind::kBlocks;

  bool operator==(const Edge&) const = default;

  bool operator<(const Edge& other) const {
    return std::tie(from_id, to_id, kind) < std::tie(other.from_id, other.to_id, other.kind);
  }
};

} // namespace workgraph::model
