#pragma once

#include <cstdint>
#include <string>

namespace workgraph::db::model {

/*
  Outgoing edge of a work item document.

  from ---kind---> to

  Only this direction is persisted. blocked_by is derived by the index.
*/

struct EdgeRecord {
  std::string from_id;
  std::string to_id;
  std::string kind; // "blocks", "parent_of"

  // event timestamp (epoch ms)
  uint64_t created_at_ms = 0;
};

} // namespace workgraph::db::model
