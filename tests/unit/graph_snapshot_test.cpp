#include "internal/graph/graph_snapshot.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/graph/graph_algorithms.hpp"
#include "internal/util/errors.hpp"

namespace {

using workgraph::graph::GraphSnapshotBuilder;
using workgraph::graph::IdSet;
using workgraph::model::WorkItem;

WorkItem Item(const std::string& id) {
  WorkItem item;
  item.id    = id;
  item.title = id;
  return item;
}

void TestAdjacencyCarriesBlocksOnly() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("epic")).AddNode(Item("a")).AddNode(Item("b")).AddNode(Item("loose"));
  builder.Blocks("a", "b").ParentOf("epic", "a").ParentOf("epic", "b");

  const auto snapshot = builder.Build(7);
  assert(snapshot->NodeCount() == 4);
  assert(snapshot->BlocksEdgeCount() == 1);
  assert(snapshot->Version() == 7);

  assert((snapshot->Forward("a") == IdSet{"b"}));
  assert((snapshot->Backward("b") == IdSet{"a"}));
  assert(snapshot->Forward("epic").empty());
  assert((snapshot->Children("epic") == IdSet{"a", "b"}));

  assert(snapshot->InHierarchy("epic"));
  assert(snapshot->InHierarchy("a"));
  assert(!snapshot->InHierarchy("loose"));

  assert(snapshot->BlocksEdges().size() == 1);
  assert(snapshot->ParentOfEdges().size() == 2);

  // unknown ids read as empty
  assert(snapshot->Forward("nope").empty());
  assert(snapshot->Find("nope") == nullptr);
}

void TestDanglingEdgeIsRejected() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("a")).Blocks("a", "ghost");

  bool threw = false;
  try {
    (void)builder.Build();
  } catch (const workgraph::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDuplicateEdgesCollapse() {
  GraphSnapshotBuilder builder;
  builder.AddNode(Item("a")).AddNode(Item("b"));
  builder.Blocks("a", "b").Blocks("a", "b");

  const auto snapshot = builder.Build();
  assert(snapshot->BlocksEdgeCount() == 1);
}

void TestGetThrowsNotFound() {
  const auto snapshot = GraphSnapshotBuilder().AddNode(Item("a")).Build();
  assert(snapshot->Get("a").id == "a");

  bool threw = false;
  try {
    (void)snapshot->Get("b");
  } catch (const workgraph::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStronglyConnectedComponents() {
  GraphSnapshotBuilder builder;
  for (const auto* id : {"a", "b", "c", "d", "e"}) {
    builder.AddNode(Item(id));
  }
  builder.Blocks("a", "b").Blocks("b", "a").Blocks("b", "c").Blocks("c", "d").Blocks("d", "c").Blocks("d", "e");

  const auto snapshot = builder.Build();
  const auto dense    = workgraph::graph::DenseGraph::Build(*snapshot);
  const auto sccs     = workgraph::graph::StronglyConnectedComponents(dense);
  assert(sccs.size() == 3);

  std::size_t cyclic = 0;
  for (const auto& component : sccs) {
    if (component.size() == 2) ++cyclic;
  }
  assert(cyclic == 2);

  const auto cycles = workgraph::graph::FindCycles(dense);
  assert(cycles.size() == 2);
  assert((cycles[0] == std::vector<std::string>{"a", "b"}));
  assert((cycles[1] == std::vector<std::string>{"c", "d"}));
}

} // namespace

int main() {
  TestAdjacencyCarriesBlocksOnly();
  TestDanglingEdgeIsRejected();
  TestDuplicateEdgesCollapse();
  TestGetThrowsNotFound();
  TestStronglyConnectedComponents();

  std::cout << "workgraph_unit_graph_snapshot: pass\n";
  return 0;
}
