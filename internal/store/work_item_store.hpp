#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/index/graph_index.hpp"
#include "internal/model/edge.hpp"
#include "internal/model/work_item.hpp"

namespace workgraph::store {

// Fields left unset keep their current value.
struct WorkItemPatch {
  std::optional<std::string>     title;
  std::optional<model::Status>   status;
  std::optional<model::Priority> priority;
  std::optional<model::ItemType> item_type;
  std::optional<double>          estimated_effort_hours;
  bool                           clear_estimated_effort = false;
};

struct StoreOptions {
  // attempts of a write that keeps losing commit races
  uint32_t max_write_retries = 8;

  // Source of ids for items created without one; defaults to
  // util::GenerateId with the prefix of the item type.
  std::function<std::string(model::ItemType)> generate_id;
};

/*
  WorkItemStore

  Write path of the work graph. The repository is the source of truth; the
  graph index follows it synchronously.

  Every write:
    1. validates its input
    2. commits one repository transaction (retried on TransactionConflict)
    3. applies the same change to the index

  Writes to one item are linearized by a per-id mutex; edge writes hold the
  mutexes of both endpoints. If the index rejects a change that the
  repository accepted, the index is rebuilt from the repository.

  Errors:
    util::ValidationError  bad input, dangling edge, deleting a referenced item
    util::NotFound         unknown id
    util::AlreadyExists    live or retired id on create
*/
class WorkItemStore {
 public:
  WorkItemStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::GraphIndex> index, StoreOptions options = {});

  // Status is forced to todo; an empty id is generated from the item type.
  model::WorkItem CreateItem(model::WorkItem item);

  model::WorkItem UpdateItem(const std::string& id, const WorkItemPatch& patch);

  model::WorkItem SetStatus(const std::string& id, model::Status status);

  // Retires the id. Rejected while any edge references the item.
  void DeleteItem(const std::string& id);

  // Adding an existing edge is a no-op.
  void AddEdge(const model::Edge& edge);

  // Removing an absent edge is a no-op.
  void RemoveEdge(const model::Edge& edge);

  model::WorkItem              GetItem(const std::string& id) const;
  std::vector<model::WorkItem> ListItems() const;

  std::vector<model::Edge> GetOutgoing(const std::string& id) const;
  std::vector<model::Edge> GetIncoming(const std::string& id) const;

  void RebuildIndex();

  index::GraphIndex& Index() {
    return *index_;
  }

  const index::GraphIndex& Index() const {
    return *index_;
  }

  // Ids that currently have a writer holding or waiting on their mutex.
  std::size_t PinnedItemCount() const;

 private:
  // Pins the mutex of one id for the lifetime of the handle. The map entry
  // is dropped when the last handle for the id goes away, so ids that never
  // existed do not accumulate.
  class ItemMutexHandle {
   public:
    ItemMutexHandle(WorkItemStore& store, std::string id);
    ~ItemMutexHandle();

    ItemMutexHandle(const ItemMutexHandle&)            = delete;
    ItemMutexHandle& operator=(const ItemMutexHandle&) = delete;

    std::mutex& operator*() const {
      return *mutex_;
    }

    bool SameAs(const ItemMutexHandle& other) const {
      return mutex_ == other.mutex_;
    }

   private:
    WorkItemStore&              store_;
    std::string                 id_;
    std::shared_ptr<std::mutex> mutex_;
  };

  std::string NextId(model::ItemType type) const;

  template <typename Fn>
  void WithRetry(std::string_view operation, Fn&& fn);

  void ApplyToIndex(const index::IndexChange& change);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<index::GraphIndex> index_;
  StoreOptions                       options_;

  mutable std::mutex                                           item_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> item_mutexes_;
};

} // namespace workgraph::store
