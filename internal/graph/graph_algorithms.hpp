#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/graph/graph_snapshot.hpp"

namespace workgraph::graph {

/*
  Dense, index-addressed copy of the blocks graph of a snapshot.

  Node i is the i-th included id in ascending id order, so every traversal
  over it is deterministic.
*/
struct DenseGraph {
  std::vector<std::string>                     ids;
  std::vector<const model::WorkItem*>          items;
  std::unordered_map<std::string, std::size_t> index;
  std::vector<std::vector<std::size_t>>        forward;

  std::size_t Size() const {
    return ids.size();
  }

  // Edges between included nodes only. The snapshot must outlive the graph.
  static DenseGraph Build(const GraphSnapshot& snapshot, const std::function<bool(const model::WorkItem&)>& include = {});
};

// Strongly connected components, sinks first (reverse topological order of
// the condensation). Members of each component are ascending.
std::vector<std::vector<std::size_t>> StronglyConnectedComponents(const DenseGraph& graph);

// Every elementary cycle (Johnson), each reported once and starting at its
// smallest id. Sorted. checkpoint, when set, is called before each start node.
std::vector<std::vector<std::string>> FindCycles(const DenseGraph& graph, const std::function<void()>& checkpoint = {});

class Bitset {
 public:
  explicit Bitset(std::size_t size = 0) : words_((size + 63) / 64, 0) {
  }

  void Set(std::size_t i) {
    words_[i / 64] |= (uint64_t{1} << (i % 64));
  }

  bool Test(std::size_t i) const {
    return (words_[i / 64] >> (i % 64)) & 1u;
  }

  Bitset& operator|=(const Bitset& other);

  std::size_t Count() const;

  void ForEach(const std::function<void(std::size_t)>& fn) const;

 private:
  std::vector<uint64_t> words_;
};

/*
  Memoized transitive closure over a DenseGraph.

  Computed once per component of the condensation, so a full pass costs
  O(C * V / 64) words instead of a traversal per node.
*/
class Reachability {
 public:
  // checkpoint, when set, is called between components.
  explicit Reachability(const DenseGraph& graph, const std::function<void()>& checkpoint = {});

  // Nodes reachable from v over one or more edges. Contains v only when v
  // sits on a cycle.
  const Bitset& From(std::size_t v) const {
    return reach_[component_of_[v]];
  }

 private:
  std::vector<std::size_t> component_of_;
  std::vector<Bitset>      reach_;
};

} // namespace workgraph::graph
