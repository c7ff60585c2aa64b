#pragma once

#include <vector>

#include "internal/db/model/edge_record.hpp"
#include "internal/db/model/work_item_record.hpp"

namespace workgraph::db::model {

/*
  One addressable unit of the store: a work item plus its outgoing edges.

  The graph index is rebuilt from the full set of documents and nothing else.
*/

struct DocumentRecord {
  WorkItemRecord          item;
  std::vector<EdgeRecord> outgoing;
};

} // namespace workgraph::db::model
