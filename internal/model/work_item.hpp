#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace workgraph::model {

enum class Status : std::uint8_t {
  kTodo       = 0,
  kInProgress = 1,
  kBlocked    = 2,
  kDone       = 3,
};

enum class Priority : std::uint8_t {
  kLow      = 0,
  kMedium   = 1,
  kHigh     = 2,
  kCritical = 3,
};

enum class ItemType : std::uint8_t {
  kFeature = 0,
  kBug     = 1,
  kTrack   = 2,
  kEpic    = 3,
};

constexpr std::string_view ToString(Status status) {
  switch (status) {
    case Status::kTodo:
      return "todo";
    case Status::kInProgress:
      return "in-progress";
    case Status::kBlocked:
      return "blocked";
    case Status::kDone:
      return "done";
  }
  return "todo";
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "low";
    case Priority::kMedium:
      return "medium";
    case Priority::kHigh:
      return "high";
    case Priority::kCritical:
      return "critical";
  }
  return "medium";
}

constexpr std::string_view ToString(ItemType type) {
  switch (type) {
    case ItemType::kFeature:
      return "feature";
    case ItemType::kBug:
      return "bug";
    case ItemType::kTrack:
      return "track";
    case ItemType::kEpic:
      return "epic";
  }
  return "feature";
}

// Prefix used for generated ids.
constexpr std::string_view IdPrefix(ItemType type) {
  switch (type) {
    case ItemType::kFeature:
      return "feat";
    case ItemType::kBug:
      return "bug";
    case ItemType::kTrack:
      return "trk";
    case ItemType::kEpic:
      return "epic";
  }
  return "item";
}

constexpr bool IsDone(Status status) {
  return status == Status::kDone;
}

constexpr bool IsAtLeast(Priority priority, Priority floor) {
  return static_cast<std::uint8_t>(priority) >= static_cast<std::uint8_t>(floor);
}

// Throw util::ValidationError on unknown spellings.
Status   ParseStatus(std::string_view value);
Priority ParsePriority(std::string_view value);
ItemType ParseItemType(std::string_view value);

/*
  WorkItem: one node of the work graph.

  Invariants (checked by Validate):
    - id is non-empty and printable
    - estimated_effort_hours, when set, is finite and >= 0
    - updated_at >= created_at
*/
struct WorkItem {
  std::string id;
  std::string title;

  Status   status    = Status::kTodo;
  Priority priority  = Priority::kMedium;
  ItemType item_type = ItemType::kFeature;

  std::optional<double> estimated_effort_hours;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  bool operator==(const WorkItem&) const = default;
};

void Validate(const WorkItem& item);

} // namespace workgraph::model
