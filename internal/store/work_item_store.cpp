#include "internal/store/work_item_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/transaction.hpp"
#include "internal/model/record_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace workgraph::store {

using workgraph::observability::IntField;
using workgraph::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
      throw db::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

constexpr int kMaxIdAttempts = 8;

std::string DescribeEdge(const model::Edge& edge) {
  return edge.from_id + " -" + std::string(model::ToString(edge.kind)) + "-> " + edge.to_id;
}

std::vector<model::Edge> ToEdges(const std::vector<db::model::EdgeRecord>& records) {
  std::vector<model::Edge> edges;
  edges.reserve(records.size());
  for (const auto& record : records) {
    edges.push_back(model::FromRecord(record));
  }
  std::sort(edges.begin(), edges.end());
  return edges;
}

} // namespace

WorkItemStore::WorkItemStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::GraphIndex> index, StoreOptions options)
    : repository_(std::move(repository)), index_(std::move(index)), options_(options) {
  if (!repository_ || !index_) {
    throw std::invalid_argument("WorkItemStore requires a repository and an index");
  }
  if (options_.max_write_retries == 0) {
    options_.max_write_retries = 1;
  }
}

WorkItemStore::ItemMutexHandle::ItemMutexHandle(WorkItemStore& store, std::string id) : store_(store), id_(std::move(id)) {
  std::lock_guard<std::mutex> lock(store_.item_mutexes_guard_);
  auto&                       item_mutex = store_.item_mutexes_[id_];
  if (!item_mutex) {
    item_mutex = std::make_shared<std::mutex>();
  }
  mutex_ = item_mutex;
}

WorkItemStore::ItemMutexHandle::~ItemMutexHandle() {
  std::lock_guard<std::mutex> lock(store_.item_mutexes_guard_);
  mutex_.reset();
  // every copy is taken and released under the guard, so the count is exact
  auto it = store_.item_mutexes_.find(id_);
  if (it != store_.item_mutexes_.end() && it->second.use_count() == 1) {
    store_.item_mutexes_.erase(it);
  }
}

std::string WorkItemStore::NextId(model::ItemType type) const {
  if (options_.generate_id) {
    return options_.generate_id(type);
  }
  return util::GenerateId(model::IdPrefix(type));
}

std::size_t WorkItemStore::PinnedItemCount() const {
  std::lock_guard<std::mutex> lock(item_mutexes_guard_);
  return item_mutexes_.size();
}

template <typename Fn>
void WorkItemStore::WithRetry(std::string_view operation, Fn&& fn) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      fn();
      return;
    } catch (const db::TransactionConflict& e) {
      if (attempt >= options_.max_write_retries) {
        WORKGRAPH_LOG_WARN("write gave up after conflicts",
                           {StringField("operation", operation), IntField("attempts", attempt), StringField("error", e.what())});
        throw;
      }
      WORKGRAPH_LOG_DEBUG("retrying conflicting write", {StringField("operation", operation), IntField("attempt", attempt)});
    }
  }
}

void WorkItemStore::ApplyToIndex(const index::IndexChange& change) {
  try {
    index_->Apply(change);
  } catch (const util::IndexInconsistent& e) {
    WORKGRAPH_LOG_WARN("index rejected committed change, rebuilding", {StringField("change", index::Describe(change)), StringField("error", e.what())});
    index_->Rebuild(*repository_);
  }
}

// ------------------------------------------------------------
// Items
// ------------------------------------------------------------

model::WorkItem WorkItemStore::CreateItem(model::WorkItem item) {
  const bool generated_id = item.id.empty();
  if (generated_id) {
    item.id = NextId(item.item_type);
  }
  if (item.title.empty()) {
    throw util::ValidationError("work item " + item.id + ": title is required");
  }

  item.status     = model::Status::kTodo;
  item.created_at = util::NowMillis();
  item.updated_at = item.created_at;
  model::Validate(item);

  for (int attempt = 1;; ++attempt) {
    ItemMutexHandle             item_mutex(*this, item.id);
    std::lock_guard<std::mutex> lock(*item_mutex);

    db::Result result;
    WithRetry("create_item", [&] {
      auto tx = repository_->Begin();
      result  = repository_->InsertItem(*tx, model::ToRecord(item));
      if (result) {
        tx->Commit();
      } else if (result.code != db::ErrorCode::AlreadyExists) {
        ThrowIfDbError(result, "create " + item.id);
      }
    });

    if (result) {
      ApplyToIndex(index::UpsertNode{item});
      break;
    }
    // a generated id may collide with a live or retired one; draw again
    if (result.code == db::ErrorCode::AlreadyExists && generated_id && attempt < kMaxIdAttempts) {
      item.id = NextId(item.item_type);
      continue;
    }
    ThrowIfDbError(result, "create " + item.id);
  }

  WORKGRAPH_LOG_INFO("work item created", {StringField("id", item.id), StringField("type", model::ToString(item.item_type))});
  return item;
}

model::WorkItem WorkItemStore::UpdateItem(const std::string& id, const WorkItemPatch& patch) {
  if (patch.title && patch.title->empty()) {
    throw util::ValidationError("work item " + id + ": title must not be empty");
  }

  ItemMutexHandle             item_mutex(*this, id);
  std::lock_guard<std::mutex> lock(*item_mutex);

  model::WorkItem updated;
  WithRetry("update_item", [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetItem(*tx, id);
    if (!record) {
      throw util::NotFound("work item not found: " + id);
    }

    updated = model::FromRecord(*record);
    if (patch.title) updated.title = *patch.title;
    if (patch.status) updated.status = *patch.status;
    if (patch.priority) updated.priority = *patch.priority;
    if (patch.item_type) updated.item_type = *patch.item_type;
    if (patch.clear_estimated_effort) {
      updated.estimated_effort_hours.reset();
    } else if (patch.estimated_effort_hours) {
      updated.estimated_effort_hours = patch.estimated_effort_hours;
    }
    updated.updated_at = std::max(util::NowMillis(), updated.created_at);
    model::Validate(updated);

    ThrowIfDbError(repository_->UpdateItem(*tx, model::ToRecord(updated)), "update " + id);
    tx->Commit();
  });

  ApplyToIndex(index::UpsertNode{updated});
  WORKGRAPH_LOG_INFO("work item updated", {StringField("id", id), StringField("status", model::ToString(updated.status))});
  return updated;
}

model::WorkItem WorkItemStore::SetStatus(const std::string& id, model::Status status) {
  WorkItemPatch patch;
  patch.status = status;
  return UpdateItem(id, patch);
}

void WorkItemStore::DeleteItem(const std::string& id) {
  ItemMutexHandle             item_mutex(*this, id);
  std::lock_guard<std::mutex> lock(*item_mutex);

  WithRetry("delete_item", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteItem(*tx, id, util::ToUnixMillis(util::NowMillis())), "delete " + id);
    tx->Commit();
  });

  ApplyToIndex(index::RemoveNode{id});
  WORKGRAPH_LOG_INFO("work item deleted", {StringField("id", id)});
}

model::WorkItem WorkItemStore::GetItem(const std::string& id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, id);
  tx->Commit();
  if (!record) {
    throw util::NotFound("work item not found: " + id);
  }
  return model::FromRecord(*record);
}

std::vector<model::WorkItem> WorkItemStore::ListItems() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListItems(*tx);
  tx->Commit();

  std::vector<model::WorkItem> items;
  items.reserve(records.size());
  for (const auto& record : records) {
    items.push_back(model::FromRecord(record));
  }
  std::sort(items.begin(), items.end(), [](const model::WorkItem& a, const model::WorkItem& b) { return a.id < b.id; });
  return items;
}

// ------------------------------------------------------------
// Edges
// ------------------------------------------------------------

void WorkItemStore::AddEdge(const model::Edge& edge) {
  if (edge.from_id == edge.to_id) {
    throw util::ValidationError("self edge on " + edge.from_id + " is not allowed");
  }

  ItemMutexHandle  from_mutex(*this, edge.from_id);
  ItemMutexHandle  to_mutex(*this, edge.to_id);
  std::scoped_lock lock(*from_mutex, *to_mutex);

  bool inserted = false;
  WithRetry("add_edge", [&] {
    auto tx = repository_->Begin();
    if (!repository_->GetItem(*tx, edge.from_id) || !repository_->GetItem(*tx, edge.to_id)) {
      throw util::ValidationError("edge references a missing work item: " + DescribeEdge(edge));
    }

    auto result = repository_->InsertEdge(*tx, model::ToRecord(edge, util::NowMillis()));
    if (result.code == db::ErrorCode::AlreadyExists) {
      inserted = false;
      return;
    }
    ThrowIfDbError(result, "add edge " + DescribeEdge(edge));
    tx->Commit();
    inserted = true;
  });

  // a duplicate still goes through the index, which treats it as a no-op
  ApplyToIndex(index::AddEdge{edge});
  if (inserted) {
    WORKGRAPH_LOG_INFO("edge added", {StringField("edge", DescribeEdge(edge))});
  }
}

void WorkItemStore::RemoveEdge(const model::Edge& edge) {
  ItemMutexHandle from_mutex(*this, edge.from_id);
  ItemMutexHandle to_mutex(*this, edge.to_id);

  // scoped_lock on one mutex twice would deadlock
  std::unique_lock<std::mutex> from_lock(*from_mutex, std::defer_lock);
  std::unique_lock<std::mutex> to_lock(*to_mutex, std::defer_lock);
  if (from_mutex.SameAs(to_mutex)) {
    from_lock.lock();
  } else {
    std::lock(from_lock, to_lock);
  }

  WithRetry("remove_edge", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteEdge(*tx, edge.from_id, edge.to_id, std::string(model::ToString(edge.kind))),
                   "remove edge " + DescribeEdge(edge));
    tx->Commit();
  });

  ApplyToIndex(index::RemoveEdge{edge});
  WORKGRAPH_LOG_INFO("edge removed", {StringField("edge", DescribeEdge(edge))});
}

std::vector<model::Edge> WorkItemStore::GetOutgoing(const std::string& id) const {
  auto tx      = repository_->Begin();
  auto records = repository_->GetOutgoing(*tx, id);
  tx->Commit();
  return ToEdges(records);
}

std::vector<model::Edge> WorkItemStore::GetIncoming(const std::string& id) const {
  auto tx      = repository_->Begin();
  auto records = repository_->GetIncoming(*tx, id);
  tx->Commit();
  return ToEdges(records);
}

void WorkItemStore::RebuildIndex() {
  index_->Rebuild(*repository_);
}

} // namespace workgraph::store
