#include "internal/index/graph_index.hpp"

#include <algorithm>
#include <functional>
#include <type_traits>

#include "internal/model/record_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace workgraph::index {

using workgraph::observability::IntField;
using workgraph::observability::StringField;

GraphIndex::GraphIndex(std::size_t shard_count)
    : shard_count_(shard_count == 0 ? kDefaultShardCount : shard_count),
      generation_(std::make_shared<Generation>(shard_count_)) {
}

std::size_t GraphIndex::ShardOf(const std::string& id) const {
  return std::hash<std::string>{}(id) % shard_count_;
}

std::shared_ptr<GraphIndex::Generation> GraphIndex::CurrentGeneration() const {
  std::lock_guard<std::mutex> lock(generation_mutex_);
  return generation_;
}

std::vector<std::size_t> GraphIndex::AffectedShards(const IndexChange& change) const {
  std::vector<std::size_t> shards = std::visit(
      [this](const auto& c) -> std::vector<std::size_t> {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, UpsertNode>) {
          return {ShardOf(c.item.id)};
        } else if constexpr (std::is_same_v<T, RemoveNode>) {
          return {ShardOf(c.id)};
        } else {
          return {ShardOf(c.edge.from_id), ShardOf(c.edge.to_id)};
        }
      },
      change);

  // ascending and unique: the global lock order
  std::sort(shards.begin(), shards.end());
  shards.erase(std::unique(shards.begin(), shards.end()), shards.end());
  return shards;
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

void GraphIndex::Apply(const IndexChange& change) {
  std::shared_lock<std::shared_mutex> gate(writer_gate_);
  auto                                generation = CurrentGeneration();

  std::vector<std::unique_lock<std::shared_mutex>> locks;
  for (auto shard : AffectedShards(change)) {
    locks.emplace_back(generation->shards[shard].mutex);
  }

  if (ApplyLocked(*generation, change)) {
    version_.fetch_add(1, std::memory_order_acq_rel);
  }
}

bool GraphIndex::ApplyLocked(Generation& generation, const IndexChange& change) {
  try {
    return std::visit(
        [&](const auto& c) -> bool {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, UpsertNode>) {
            return ApplyUpsert(generation, c);
          } else if constexpr (std::is_same_v<T, RemoveNode>) {
            return ApplyRemoveNode(generation, c);
          } else if constexpr (std::is_same_v<T, AddEdge>) {
            return ApplyAddEdge(generation, c);
          } else {
            return ApplyRemoveEdge(generation, c);
          }
        },
        change);
  } catch (const util::ValidationError& e) {
    throw util::IndexInconsistent(Describe(change) + ": " + e.what());
  }
}

bool GraphIndex::ApplyUpsert(Generation& generation, const UpsertNode& change) {
  model::Validate(change.item);

  auto& shard = generation.shards[ShardOf(change.item.id)];
  auto  it    = shard.nodes.find(change.item.id);
  if (it != shard.nodes.end() && it->second == change.item) {
    return false;
  }
  shard.nodes.insert_or_assign(change.item.id, change.item);
  return true;
}

bool GraphIndex::ApplyRemoveNode(Generation& generation, const RemoveNode& change) {
  auto& shard = generation.shards[ShardOf(change.id)];
  if (!shard.nodes.contains(change.id)) {
    return false;
  }

  auto has_edges = [&](const std::map<std::string, std::set<Adjacent>>& adjacency) {
    auto it = adjacency.find(change.id);
    return it != adjacency.end() && !it->second.empty();
  };
  if (has_edges(shard.outgoing) || has_edges(shard.incoming)) {
    throw util::IndexInconsistent("remove node " + change.id + ": node still has edges");
  }

  shard.nodes.erase(change.id);
  shard.outgoing.erase(change.id);
  shard.incoming.erase(change.id);
  return true;
}

bool GraphIndex::ApplyAddEdge(Generation& generation, const AddEdge& change) {
  const auto& edge = change.edge;
  if (edge.from_id == edge.to_id) {
    throw util::IndexInconsistent(Describe(change) + ": self edge");
  }

  auto& from_shard = generation.shards[ShardOf(edge.from_id)];
  auto& to_shard   = generation.shards[ShardOf(edge.to_id)];
  if (!from_shard.nodes.contains(edge.from_id) || !to_shard.nodes.contains(edge.to_id)) {
    throw util::IndexInconsistent(Describe(change) + ": dangling edge");
  }

  auto& outgoing            = from_shard.outgoing[edge.from_id];
  auto [position, inserted] = outgoing.insert(Adjacent{edge.to_id, edge.kind});
  if (!inserted) {
    return false;
  }

  try {
    to_shard.incoming[edge.to_id].insert(Adjacent{edge.from_id, edge.kind});
  } catch (const std::exception& e) {
    outgoing.erase(position);
    throw util::IndexInconsistent(Describe(change) + ": " + e.what());
  }
  return true;
}

bool GraphIndex::ApplyRemoveEdge(Generation& generation, const RemoveEdge& change) {
  const auto& edge       = change.edge;
  auto&       from_shard = generation.shards[ShardOf(edge.from_id)];
  auto&       to_shard   = generation.shards[ShardOf(edge.to_id)];

  auto out = from_shard.outgoing.find(edge.from_id);
  if (out == from_shard.outgoing.end() || out->second.erase(Adjacent{edge.to_id, edge.kind}) == 0) {
    return false;
  }
  if (out->second.empty()) {
    from_shard.outgoing.erase(out);
  }

  auto in = to_shard.incoming.find(edge.to_id);
  if (in != to_shard.incoming.end()) {
    in->second.erase(Adjacent{edge.from_id, edge.kind});
    if (in->second.empty()) {
      to_shard.incoming.erase(in);
    }
  }
  return true;
}

// ------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------

std::shared_ptr<GraphIndex::Generation> GraphIndex::Load(db::Repository& repository) {
  std::vector<db::model::DocumentRecord> documents;
  {
    auto tx   = repository.Begin();
    documents = repository.ListDocuments(*tx);
    tx->Commit();
  }

  auto fresh = std::make_shared<Generation>(shard_count_);

  // nodes first: a document may point at an item listed after it
  for (const auto& document : documents) {
    IndexChange change = UpsertNode{};
    try {
      change = UpsertNode{model::FromRecord(document.item)};
    } catch (const util::ValidationError& e) {
      throw util::IndexInconsistent("document " + document.item.id + ": " + e.what());
    }
    ApplyLocked(*fresh, change);
  }

  for (const auto& document : documents) {
    for (const auto& record : document.outgoing) {
      IndexChange change = AddEdge{};
      try {
        change = AddEdge{model::FromRecord(record)};
      } catch (const util::ValidationError& e) {
        throw util::IndexInconsistent("document " + document.item.id + ": " + e.what());
      }
      ApplyLocked(*fresh, change);
    }
  }

  return fresh;
}

void GraphIndex::Rebuild(db::Repository& repository) {
  std::unique_lock<std::shared_mutex> gate(writer_gate_);

  std::shared_ptr<Generation> fresh;
  try {
    fresh = Load(repository);
  } catch (const std::exception& e) {
    WORKGRAPH_LOG_ERROR("graph index rebuild failed", {StringField("error", e.what())});
    throw;
  }

  uint64_t version = 0;
  {
    std::lock_guard<std::mutex> lock(generation_mutex_);
    generation_ = std::move(fresh);
    version     = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
    rebuild_count_.fetch_add(1, std::memory_order_acq_rel);
  }

  WORKGRAPH_LOG_INFO("graph index rebuilt", {IntField("version", static_cast<int64_t>(version))});
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::shared_ptr<const graph::GraphSnapshot> GraphIndex::Snapshot() const {
  for (;;) {
    auto generation = CurrentGeneration();

    std::vector<std::shared_lock<std::shared_mutex>> locks;
    locks.reserve(generation->shards.size());
    for (auto& shard : generation->shards) {
      locks.emplace_back(shard.mutex);
    }

    uint64_t version = 0;
    {
      std::lock_guard<std::mutex> lock(generation_mutex_);
      if (generation_ != generation) {
        continue; // swapped by a rebuild while locking
      }
      version = version_.load(std::memory_order_acquire);
    }

    {
      std::lock_guard<std::mutex> lock(snapshot_cache_mutex_);
      if (snapshot_cache_ && snapshot_cache_->Version() == version) {
        return snapshot_cache_;
      }
    }

    graph::GraphSnapshotBuilder builder;
    for (const auto& shard : generation->shards) {
      for (const auto& [id, item] : shard.nodes) {
        builder.AddNode(item);
      }
      for (const auto& [from, targets] : shard.outgoing) {
        for (const auto& target : targets) {
          builder.AddEdge(model::Edge{from, target.id, target.kind});
        }
      }
    }

    std::shared_ptr<const graph::GraphSnapshot> snapshot;
    try {
      snapshot = builder.Build(version);
    } catch (const util::ValidationError& e) {
      throw util::IndexInconsistent(std::string("snapshot: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(snapshot_cache_mutex_);
    if (!snapshot_cache_ || snapshot_cache_->Version() < version) {
      snapshot_cache_ = snapshot;
    }
    return snapshot;
  }
}

std::vector<model::WorkItem> GraphIndex::GetAllNodes() const {
  auto snapshot = Snapshot();

  std::vector<model::WorkItem> nodes;
  nodes.reserve(snapshot->NodeCount());
  for (const auto& [id, item] : snapshot->Nodes()) {
    nodes.push_back(item);
  }
  return nodes;
}

std::vector<model::Edge> GraphIndex::GetAllEdges(model::EdgeKind kind) const {
  auto snapshot = Snapshot();
  switch (kind) {
    case model::EdgeKind::kBlocks:
      return snapshot->BlocksEdges();
    case model::EdgeKind::kParentOf:
      return snapshot->ParentOfEdges();
  }
  return {};
}

std::optional<model::WorkItem> GraphIndex::FindNode(const std::string& id) const {
  auto        generation = CurrentGeneration();
  const auto& shard      = generation->shards[ShardOf(id)];

  std::shared_lock<std::shared_mutex> lock(shard.mutex);
  auto                                it = shard.nodes.find(id);
  if (it == shard.nodes.end()) {
    return std::nullopt;
  }
  return it->second;
}

model::WorkItem GraphIndex::GetNode(const std::string& id) const {
  auto node = FindNode(id);
  if (!node) {
    throw util::NotFound("work item not found: " + id);
  }
  return *node;
}

IndexStats GraphIndex::Stats() const {
  auto snapshot = Snapshot();

  IndexStats stats;
  stats.node_count           = snapshot->NodeCount();
  stats.blocks_edge_count    = snapshot->BlocksEdgeCount();
  stats.parent_of_edge_count = snapshot->ParentOfEdges().size();
  stats.version              = snapshot->Version();
  stats.rebuild_count        = rebuild_count_.load(std::memory_order_acquire);
  stats.shard_count          = shard_count_;
  return stats;
}

} // namespace workgraph::index
