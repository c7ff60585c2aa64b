#pragma once

#include <cstdint>
#include <memory>

#include "internal/analytics/analytics_weights.hpp"

namespace workgraph::store { class WorkItemStore; }
namespace workgraph::index { class GraphIndex; }

namespace workgraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<workgraph::store::WorkItemStore> store;
  std::shared_ptr<workgraph::index::GraphIndex>    index;

  workgraph::analytics::AnalyticsWeights weights;

  // applied when a call carries no deadline; 0 disables
  uint32_t default_deadline_ms = 0;
};

} // namespace workgraph::service
