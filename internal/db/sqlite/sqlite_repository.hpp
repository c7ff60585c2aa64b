#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace workgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
