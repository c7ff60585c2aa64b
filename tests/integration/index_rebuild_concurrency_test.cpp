#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/analytics/dependency_analytics.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/index/graph_index.hpp"
#include "internal/store/work_item_store.hpp"

#if WORKGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using workgraph::model::Edge;
using workgraph::model::EdgeKind;
using workgraph::model::Status;
using workgraph::model::WorkItem;

constexpr int kWriters        = 3;
constexpr int kItemsPerWriter = 30;

WorkItem Draft(const std::string& id) {
  WorkItem item;
  item.id    = id;
  item.title = "task " + id;
  return item;
}

// Writers build chains through the store while one thread keeps rebuilding
// the index and another keeps analysing snapshots. Afterwards the index must
// equal a fresh rebuild from the repository.
void RunScenario(const std::string& name, std::shared_ptr<workgraph::db::Repository> repository) {
  auto index = std::make_shared<workgraph::index::GraphIndex>(8);
  workgraph::store::WorkItemStore store(repository, index, workgraph::store::StoreOptions{.max_write_retries = 10'000});

  std::atomic<bool> writing{true};

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      std::string previous;
      for (int i = 0; i < kItemsPerWriter; ++i) {
        const auto id = name + "-w" + std::to_string(w) + "-" + std::to_string(i);
        store.CreateItem(Draft(id));
        if (!previous.empty()) {
          store.AddEdge(Edge{previous, id, EdgeKind::kBlocks});
        }
        if (i % 5 == 0) {
          store.SetStatus(id, Status::kInProgress);
        }
        previous = id;
      }
    });
  }

  std::thread rebuilder([&] {
    while (writing.load()) {
      store.RebuildIndex();
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  });

  std::thread analyst([&] {
    uint64_t last_version = 0;
    while (writing.load()) {
      const auto snapshot = index->Snapshot();
      assert(snapshot->Version() >= last_version);
      last_version = snapshot->Version();

      for (const auto& edge : snapshot->BlocksEdges()) {
        assert(snapshot->Contains(edge.from_id));
        assert(snapshot->Contains(edge.to_id));
      }

      workgraph::analytics::DependencyAnalytics engine(*snapshot);
      const auto parallel = engine.GetParallelWork();
      assert(parallel.cycle_members.empty());
      (void)engine.FindBottlenecks();
    }
  });

  for (auto& writer : writers) writer.join();
  writing.store(false);
  rebuilder.join();
  analyst.join();

  const auto stats = index->Stats();
  assert(stats.node_count == kWriters * kItemsPerWriter);
  assert(stats.blocks_edge_count == kWriters * (kItemsPerWriter - 1));
  assert(stats.rebuild_count >= 1);

  workgraph::index::GraphIndex fresh;
  fresh.Rebuild(*repository);
  assert(fresh.GetAllNodes() == index->GetAllNodes());
  assert(fresh.GetAllEdges(EdgeKind::kBlocks) == index->GetAllEdges(EdgeKind::kBlocks));
}

} // namespace

int main() {
  RunScenario("memory", std::make_shared<workgraph::db::memory::MemoryRepository>());

#if WORKGRAPH_DB_SQLITE
  const auto db_path = (std::filesystem::temp_directory_path() / "workgraph_index_rebuild_concurrency.db").string();
  std::filesystem::remove(db_path);
  {
    auto db = std::make_shared<workgraph::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    RunScenario("sqlite", std::make_shared<workgraph::db::sqlite::SqliteRepository>(std::move(db)));
  }
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
#endif

  std::cout << "workgraph_integration_index_rebuild_concurrency: pass\n";
  return 0;
}
