#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/work_item_record.hpp"

#if WORKGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using workgraph::db::ErrorCode;
using workgraph::db::Repository;
using workgraph::db::memory::MemoryRepository;
using workgraph::db::model::EdgeRecord;
using workgraph::db::model::WorkItemRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

WorkItemRecord Record(const std::string& id) {
  WorkItemRecord record;
  record.id            = id;
  record.title         = "title " + id;
  record.status        = "todo";
  record.priority      = "medium";
  record.item_type     = "feature";
  record.created_at_ms = 1'000;
  record.updated_at_ms = 1'000;
  return record;
}

EdgeRecord Blocks(const std::string& from, const std::string& to) {
  return EdgeRecord{.from_id = from, .to_id = to, .kind = "blocks", .created_at_ms = 2'000};
}

void VerifyItemLifecycle(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-item";
  {
    auto tx     = repo.Begin();
    auto record = Record(id);
    record.estimated_effort_hours = 2.5;
    assert(repo.InsertItem(*tx, record));
    assert(repo.InsertItem(*tx, record).code == ErrorCode::AlreadyExists);

    auto read = repo.GetItem(*tx, id);
    assert(read.has_value());
    assert(read->title == "title " + id);
    assert(read->estimated_effort_hours == 2.5);
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto record = *repo.GetItem(*tx, id);
    record.status = "in-progress";
    record.estimated_effort_hours.reset();
    record.updated_at_ms = 5'000;
    assert(repo.UpdateItem(*tx, record));
    assert(repo.UpdateItem(*tx, Record(prefix + "-missing")).code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto read = repo.GetItem(*tx, id);
    assert(read->status == "in-progress");
    assert(!read->estimated_effort_hours.has_value());
    assert(read->updated_at_ms == 5'000);

    assert(repo.DeleteItem(*tx, id, 6'000));
    assert(!repo.GetItem(*tx, id).has_value());
    assert(repo.IsRetired(*tx, id));
    assert(repo.InsertItem(*tx, Record(id)).code == ErrorCode::AlreadyExists);
    assert(repo.DeleteItem(*tx, id, 7'000).code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyEdgeRules(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-a";
  const auto b = prefix + "-b";
  const auto c = prefix + "-c";

  auto tx = repo.Begin();
  for (const auto& id : {a, b, c}) {
    assert(repo.InsertItem(*tx, Record(id)));
  }

  assert(repo.InsertEdge(*tx, Blocks(a, b)));
  assert(repo.InsertEdge(*tx, Blocks(a, c)));
  assert(repo.InsertEdge(*tx, EdgeRecord{.from_id = c, .to_id = b, .kind = "parent_of", .created_at_ms = 2'000}));
  assert(repo.InsertEdge(*tx, Blocks(a, b)).code == ErrorCode::AlreadyExists);
  assert(repo.InsertEdge(*tx, Blocks(a, prefix + "-ghost")).code == ErrorCode::ConstraintViolation);

  auto outgoing = repo.GetOutgoing(*tx, a);
  std::sort(outgoing.begin(), outgoing.end(), [](const EdgeRecord& x, const EdgeRecord& y) { return x.to_id < y.to_id; });
  assert(outgoing.size() == 2);
  assert(outgoing[0].to_id == b);
  assert(outgoing[1].to_id == c);

  assert(repo.GetIncoming(*tx, b).size() == 2);

  // referenced from both sides
  assert(repo.DeleteItem(*tx, a, 9'000).code == ErrorCode::ConstraintViolation);
  assert(repo.DeleteItem(*tx, b, 9'000).code == ErrorCode::ConstraintViolation);

  assert(repo.DeleteEdge(*tx, a, b, "blocks"));
  assert(repo.DeleteEdge(*tx, a, b, "blocks"));
  assert(repo.DeleteEdge(*tx, c, b, "parent_of"));
  assert(repo.DeleteItem(*tx, b, 9'000));
  tx->Commit();
}

void VerifyDocumentsScan(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, Record(prefix + "-2")));
    assert(repo.InsertItem(*tx, Record(prefix + "-1")));
    assert(repo.InsertEdge(*tx, Blocks(prefix + "-1", prefix + "-2")));
    tx->Commit();
  }

  auto tx        = repo.Begin();
  auto documents = repo.ListDocuments(*tx);
  tx->Commit();

  assert(std::is_sorted(documents.begin(), documents.end(), [](const auto& x, const auto& y) { return x.item.id < y.item.id; }));

  auto first = std::find_if(documents.begin(), documents.end(), [&](const auto& doc) { return doc.item.id == prefix + "-1"; });
  assert(first != documents.end());
  assert(first->outgoing.size() == 1);
  assert(first->outgoing[0].to_id == prefix + "-2");
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, Record(prefix + "-rolled")));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertItem(*tx, Record(prefix + "-dropped")));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetItem(*tx, prefix + "-rolled").has_value());
  assert(!repo.GetItem(*tx, prefix + "-dropped").has_value());
  tx->Commit();
}

void VerifyConflictingWriters(BackendFactory& backend, Repository& repo, const std::string& prefix) {
  if (!backend.supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  assert(repo.InsertItem(*tx1, Record(prefix + "-first")));
  assert(repo.InsertItem(*tx2, Record(prefix + "-second")));
  tx1->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const workgraph::db::TransactionConflict&) {
    threw = true;
  }
  assert(threw);

  auto check = repo.Begin();
  assert(repo.GetItem(*check, prefix + "-first").has_value());
  assert(!repo.GetItem(*check, prefix + "-second").has_value());
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertItem(*tx, Record(prefix + "-x")));
    assert(repo->InsertItem(*tx, Record(prefix + "-y")));
    assert(repo->InsertEdge(*tx, Blocks(prefix + "-x", prefix + "-y")));
    assert(repo->InsertItem(*tx, Record(prefix + "-gone")));
    assert(repo->DeleteItem(*tx, prefix + "-gone", 3'000));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetItem(*tx, prefix + "-x").has_value());
  assert(repo->GetOutgoing(*tx, prefix + "-x").size() == 1);
  assert(repo->IsRetired(*tx, prefix + "-gone"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if WORKGRAPH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("workgraph_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<workgraph::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<workgraph::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      // one connection serializes its transactions
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackend(BackendFactory backend) {
  auto repo = backend.make_repository();

  VerifyItemLifecycle(*repo, backend.name);
  VerifyEdgeRules(*repo, backend.name);
  VerifyDocumentsScan(*repo, backend.name + "-doc");
  VerifyRollbackDiscardsWrites(*repo, backend.name);
  VerifyConflictingWriters(backend, *repo, backend.name);

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-restart");
  backend.cleanup();
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if WORKGRAPH_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "workgraph_integration_repository_parity: pass\n";
  return 0;
}
