#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace workgraph::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Work items
// ------------------------------------------------------------

Result MemoryRepository::InsertItem(Transaction& t, const model::WorkItemRecord& r) {
  const auto& view = TX(t).View();
  if (view.items.contains(r.id) || view.retired.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  TX(t).Mutable().items[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkItemRecord> MemoryRepository::ListItems(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::WorkItemRecord> records;
  records.reserve(s.items.size());
  for (const auto& [_, record] : s.items) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::WorkItemRecord& r) {
  if (!TX(t).View().items.contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  TX(t).Mutable().items[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteItem(Transaction& t, const std::string& id, uint64_t retired_at_ms) {
  const auto& view = TX(t).View();
  if (!view.items.contains(id)) return Result::Err(ErrorCode::NotFound, id);

  auto out = view.outgoing.find(id);
  if (out != view.outgoing.end() && !out->second.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, id + " has outgoing edges");
  }
  for (const auto& [_, edges] : view.outgoing) {
    const bool referenced = std::any_of(edges.begin(), edges.end(), [&](const model::EdgeRecord& e) { return e.to_id == id; });
    if (referenced) return Result::Err(ErrorCode::ConstraintViolation, id + " has incoming edges");
  }

  auto& s = TX(t).Mutable();
  s.items.erase(id);
  s.outgoing.erase(id);
  s.retired[id] = retired_at_ms;
  return Result::Ok();
}

bool MemoryRepository::IsRetired(Transaction& t, const std::string& id) {
  return TX(t).View().retired.contains(id);
}

// ------------------------------------------------------------
// Edges
// ------------------------------------------------------------

Result MemoryRepository::InsertEdge(Transaction& t, const model::EdgeRecord& r) {
  const auto& view = TX(t).View();
  if (!view.items.contains(r.from_id) || !view.items.contains(r.to_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "edge endpoint missing: " + r.from_id + " -> " + r.to_id);
  }

  auto existing = view.outgoing.find(r.from_id);
  if (existing != view.outgoing.end()) {
    const bool duplicate = std::any_of(existing->second.begin(), existing->second.end(),
                                       [&](const model::EdgeRecord& e) { return e.to_id == r.to_id && e.kind == r.kind; });
    if (duplicate) return Result::Err(ErrorCode::AlreadyExists, r.from_id + " -> " + r.to_id);
  }

  TX(t).Mutable().outgoing[r.from_id].push_back(r);
  return Result::Ok();
}

Result MemoryRepository::DeleteEdge(Transaction& t, const std::string& from_id, const std::string& to_id, const std::string& kind) {
  const auto& view = TX(t).View();
  auto        it   = view.outgoing.find(from_id);
  if (it == view.outgoing.end()) return Result::Ok();

  auto matches = [&](const model::EdgeRecord& e) { return e.to_id == to_id && e.kind == kind; };
  if (std::none_of(it->second.begin(), it->second.end(), matches)) return Result::Ok();

  auto& edges = TX(t).Mutable().outgoing[from_id];
  std::erase_if(edges, matches);
  return Result::Ok();
}

std::vector<model::EdgeRecord> MemoryRepository::GetOutgoing(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.outgoing.find(id);
  if (it == s.outgoing.end()) return {};
  return it->second;
}

std::vector<model::EdgeRecord> MemoryRepository::GetIncoming(Transaction& t, const std::string& id) {
  std::vector<model::EdgeRecord> out;
  for (const auto& [_, edges] : TX(t).View().outgoing)
    for (const auto& e : edges)
      if (e.to_id == id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------
// Documents
// ------------------------------------------------------------

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::DocumentRecord> documents;
  documents.reserve(s.items.size());
  for (const auto& [id, item] : s.items) {
    model::DocumentRecord doc;
    doc.item = item;
    auto it  = s.outgoing.find(id);
    if (it != s.outgoing.end()) doc.outgoing = it->second;
    documents.push_back(std::move(doc));
  }
  return documents;
}

} // namespace workgraph::db::memory
