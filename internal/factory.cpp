#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/analytics/analytics_weights.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if WORKGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace workgraph::factory {

using workgraph::observability::BoolField;
using workgraph::observability::IntField;
using workgraph::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const workgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WORKGRAPH_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = database.sqlite().busy_timeout_ms();
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    sqlite_db->BootstrapSchema();
    WORKGRAPH_LOG_INFO("SQLite repository opened", {StringField("path", database.sqlite().path()), BoolField("wal_mode", options.wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  WORKGRAPH_LOG_INFO("In-memory repository selected");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const workgraph::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Source of truth and derived index
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto shard_count = config.index().shard_count() > 0 ? config.index().shard_count() : index::GraphIndex::kDefaultShardCount;
  app.index              = std::make_shared<index::GraphIndex>(shard_count);

  store::StoreOptions store_options;
  if (config.analytics().max_write_retries() > 0) {
    store_options.max_write_retries = config.analytics().max_write_retries();
  }
  app.store = std::make_shared<store::WorkItemStore>(app.repository, app.index, store_options);

  if (config.index().rebuild_on_start()) {
    app.store->RebuildIndex();
    const auto stats = app.index->Stats();
    WORKGRAPH_LOG_INFO("Index rebuilt on start", {IntField("nodes", static_cast<int64_t>(stats.node_count)),
                                                  IntField("blocks_edges", static_cast<int64_t>(stats.blocks_edge_count))});
  } else if (config.database().has_sqlite()) {
    WORKGRAPH_LOG_WARN("Index starts empty over a persistent repository; call AdminService.RebuildIndex");
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store               = app.store;
  ctx.index               = app.index;
  ctx.weights             = analytics::WeightsFromConfig(config.analytics().weights());
  ctx.default_deadline_ms = config.analytics().default_deadline_ms();

  app.work_item_service = std::make_shared<service::WorkItemService>(ctx);
  app.analytics_service = std::make_shared<service::AnalyticsService>(ctx);
  app.admin_service     = std::make_shared<service::AdminService>(ctx);

  return app;
}

} // namespace workgraph::factory
