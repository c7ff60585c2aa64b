#pragma once

#include "internal/service/service_context.hpp"
#include "workgraph/v1.hpp"

namespace workgraph::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  // Rebuilds the index from the repository. Writers wait; readers keep the
  // previous snapshot until the swap.
  workgraph::v1::RebuildIndexResponse RebuildIndex(const workgraph::v1::RebuildIndexRequest& req);

  workgraph::v1::GetIndexStatsResponse GetIndexStats(const workgraph::v1::GetIndexStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace workgraph::service
