#pragma once

#include <stdexcept>
#include <string>

namespace workgraph::db {

/*
  One atomic unit of work against the work item documents.

  A store write (item upsert plus its edge changes, or a delete plus id
  retirement) runs inside a single transaction, so the index never observes
  half of it. Nothing is visible to other transactions before Commit(); a
  transaction destroyed without Commit() is rolled back.

  sqlite: BEGIN IMMEDIATE on the shared connection
  memory: private copy of the committed state, version-checked on Commit()
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

// Commit lost a race against another writer; the whole unit of work may be retried.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace workgraph::db
