#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/work_item_record.hpp"

namespace workgraph::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed write is atomic: a document is never half-written
  - Edges are stored once, with their source item

  The DB is the source of truth for:
    work items
    blocks / parent_of edges
    retired ids
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Work items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::WorkItemRecord&) = 0;

  virtual std::optional<model::WorkItemRecord> GetItem(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::WorkItemRecord> ListItems(Transaction&) = 0;

  virtual Result UpdateItem(Transaction&, const model::WorkItemRecord&) = 0;

  // Removes the item and retires its id. Fails with ConstraintViolation while
  // any edge still references the item.
  virtual Result DeleteItem(Transaction&, const std::string& id, uint64_t retired_at_ms) = 0;

  virtual bool IsRetired(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Edges
  // ---------------------------------------------------------------------

  virtual Result InsertEdge(Transaction&, const model::EdgeRecord&) = 0;

  // Deleting an absent edge is not an error.
  virtual Result DeleteEdge(Transaction&, const std::string& from_id, const std::string& to_id, const std::string& kind) = 0;

  virtual std::vector<model::EdgeRecord> GetOutgoing(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::EdgeRecord> GetIncoming(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Documents (rebuild scan)
  // ---------------------------------------------------------------------

  // Every item with its outgoing edges, ordered by item id.
  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&) = 0;
};

} // namespace workgraph::db
