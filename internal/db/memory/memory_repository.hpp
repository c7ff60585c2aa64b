#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace workgraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertItem(Transaction&, const model::WorkItemRecord&) override;
  std::optional<model::WorkItemRecord> GetItem(Transaction&, const std::string&) override;
  std::vector<model::WorkItemRecord> ListItems(Transaction&) override;
  Result UpdateItem(Transaction&, const model::WorkItemRecord&) override;
  Result DeleteItem(Transaction&, const std::string&, uint64_t retired_at_ms) override;
  bool IsRetired(Transaction&, const std::string&) override;

  Result InsertEdge(Transaction&, const model::EdgeRecord&) override;
  Result DeleteEdge(Transaction&, const std::string& from_id, const std::string& to_id,
                    const std::string& kind) override;
  std::vector<model::EdgeRecord> GetOutgoing(Transaction&, const std::string&) override;
  std::vector<model::EdgeRecord> GetIncoming(Transaction&, const std::string&) override;

  std::vector<model::DocumentRecord> ListDocuments(Transaction&) override;

private:
  friend class MemoryTransaction;

  // Ordered containers keep listings deterministic.
  struct State {
    std::map<std::string, model::WorkItemRecord> items;
    std::map<std::string, std::vector<model::EdgeRecord>> outgoing;
    std::map<std::string, uint64_t> retired;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
