#pragma once

namespace workgraph::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Edge rows are keyed by their source item: one document = one work_item row
  plus the work_item_edge rows with from_id = id.
*/

// work items

static constexpr const char* INSERT_ITEM =
    "INSERT INTO work_item(id,title,status,priority,item_type,estimated_effort_hours,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ITEM =
    "SELECT id,title,status,priority,item_type,estimated_effort_hours,created_at_ms,updated_at_ms"
    " FROM work_item WHERE id=?;";

static constexpr const char* SELECT_ALL_ITEMS =
    "SELECT id,title,status,priority,item_type,estimated_effort_hours,created_at_ms,updated_at_ms"
    " FROM work_item ORDER BY id;";

static constexpr const char* UPDATE_ITEM =
    "UPDATE work_item SET title=?,status=?,priority=?,item_type=?,estimated_effort_hours=?,created_at_ms=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_ITEM =
    "DELETE FROM work_item WHERE id=?;";

// retired ids

static constexpr const char* INSERT_RETIRED =
    "INSERT OR REPLACE INTO retired_work_item(id,retired_at_ms) VALUES(?,?);";

static constexpr const char* SELECT_RETIRED =
    "SELECT id FROM retired_work_item WHERE id=?;";

// edges

static constexpr const char* INSERT_EDGE =
    "INSERT INTO work_item_edge(from_id,to_id,kind,created_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_EDGE =
    "SELECT from_id FROM work_item_edge WHERE from_id=? AND to_id=? AND kind=?;";

static constexpr const char* DELETE_EDGE =
    "DELETE FROM work_item_edge WHERE from_id=? AND to_id=? AND kind=?;";

static constexpr const char* SELECT_OUTGOING =
    "SELECT from_id,to_id,kind,created_at_ms"
    " FROM work_item_edge WHERE from_id=? ORDER BY to_id,kind;";

static constexpr const char* SELECT_INCOMING =
    "SELECT from_id,to_id,kind,created_at_ms"
    " FROM work_item_edge WHERE to_id=? ORDER BY from_id,kind;";

static constexpr const char* SELECT_ALL_EDGES =
    "SELECT from_id,to_id,kind,created_at_ms"
    " FROM work_item_edge ORDER BY from_id,to_id,kind;";

static constexpr const char* COUNT_REFERENCES =
    "SELECT COUNT(*) FROM work_item_edge WHERE from_id=?1 OR to_id=?1;";

}
