#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_snapshot.hpp"
#include "internal/index/index_change.hpp"
#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"

namespace workgraph::index {

struct IndexStats {
  std::size_t node_count           = 0;
  std::size_t blocks_edge_count    = 0;
  std::size_t parent_of_edge_count = 0;
  uint64_t    version              = 0;
  uint64_t    rebuild_count        = 0;
  std::size_t shard_count          = 0;
};

/*
  GraphIndex

  Derived, rebuildable mirror of the work item store.

  Layout:
    generation -> N shards, chosen by hash(id)
    shard      -> nodes, outgoing and incoming adjacency of the ids it owns

  Locking:
    Apply()    shared writer gate + exclusive locks on the affected shards
               only, taken in ascending shard order
    Snapshot() shared locks on every shard, in order, for a consistent cut
    Rebuild()  exclusive writer gate while scanning the store into a fresh
               generation, then a pointer swap; readers keep reading the
               generation they already hold

  Every effective mutation bumps the version. Applying a change that is
  already reflected is a no-op and leaves the version alone.

  A change that cannot be applied (dangling edge, removing a node that still
  has edges, invalid item) leaves the index untouched and raises
  util::IndexInconsistent.
*/
class GraphIndex {
 public:
  static constexpr std::size_t kDefaultShardCount = 16;

  explicit GraphIndex(std::size_t shard_count = kDefaultShardCount);

  GraphIndex(const GraphIndex&)            = delete;
  GraphIndex& operator=(const GraphIndex&) = delete;

  void Apply(const IndexChange& change);

  // Discards current state and reloads every document from the repository.
  // On failure the previous generation stays in place.
  void Rebuild(db::Repository& repository);

  std::shared_ptr<const graph::GraphSnapshot> Snapshot() const;

  // ---------------------------------------------------------------------
  // Boundary reads
  // ---------------------------------------------------------------------

  // Read from the current snapshot, so nodes and edges form a consistent cut.
  // Nodes are ordered by id, edges by (from, to).
  std::vector<model::WorkItem> GetAllNodes() const;

  std::vector<model::Edge> GetAllEdges(model::EdgeKind kind = model::EdgeKind::kBlocks) const;

  // Throws util::NotFound.
  model::WorkItem GetNode(const std::string& id) const;

  std::optional<model::WorkItem> FindNode(const std::string& id) const;

  IndexStats Stats() const;

  uint64_t Version() const {
    return version_.load(std::memory_order_acquire);
  }

 private:
  struct Adjacent {
    std::string     id;
    model::EdgeKind kind;

    bool operator<(const Adjacent& other) const {
      return std::tie(id, kind) < std::tie(other.id, other.kind);
    }
  };

  struct Shard {
    mutable std::shared_mutex                  mutex;
    std::map<std::string, model::WorkItem>     nodes;
    std::map<std::string, std::set<Adjacent>>  outgoing;
    std::map<std::string, std::set<Adjacent>>  incoming;
  };

  struct Generation {
    explicit Generation(std::size_t shard_count) : shards(shard_count) {
    }

    std::vector<Shard> shards;
  };

  std::size_t ShardOf(const std::string& id) const;

  std::shared_ptr<Generation> CurrentGeneration() const;

  // Returns true when the generation changed. Caller holds the locks of the
  // affected shards (or owns the generation exclusively).
  bool ApplyLocked(Generation& generation, const IndexChange& change);

  bool ApplyUpsert(Generation& generation, const UpsertNode& change);
  bool ApplyRemoveNode(Generation& generation, const RemoveNode& change);
  bool ApplyAddEdge(Generation& generation, const AddEdge& change);
  bool ApplyRemoveEdge(Generation& generation, const RemoveEdge& change);

  std::vector<std::size_t> AffectedShards(const IndexChange& change) const;

  // Fresh generation loaded from the repository. Throws on malformed documents.
  std::shared_ptr<Generation> Load(db::Repository& repository);

  std::size_t shard_count_;

  // Apply shares it, Rebuild owns it.
  mutable std::shared_mutex writer_gate_;

  // Guards generation_ and the version read paired with it.
  mutable std::mutex          generation_mutex_;
  std::shared_ptr<Generation> generation_;

  std::atomic<uint64_t> version_{0};
  std::atomic<uint64_t> rebuild_count_{0};

  mutable std::mutex                                  snapshot_cache_mutex_;
  mutable std::shared_ptr<const graph::GraphSnapshot> snapshot_cache_;
};

} // namespace workgraph::index
