#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/index/graph_index.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/service/work_item_service.hpp"
#include "internal/store/work_item_store.hpp"

namespace workgraph::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<index::GraphIndex>    index;
  std::shared_ptr<store::WorkItemStore> store;

  std::shared_ptr<service::WorkItemService>  work_item_service;
  std::shared_ptr<service::AnalyticsService> analytics_service;
  std::shared_ptr<service::AdminService>     admin_service;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application and the only place that
  knows concrete repository types.
*/
Application Build(const workgraph::runtime::config::RuntimeConfig& config);

// Chooses the repository backend named by config.database.
std::shared_ptr<db::Repository> BuildRepository(const workgraph::runtime::config::RuntimeConfig& config);

} // namespace workgraph::factory
