#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace workgraph::util {

// created_at / updated_at are wall-clock; deadlines use steady_clock instead.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Work items are persisted as unix milliseconds.
uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Current time truncated to milliseconds, so a stored item reads back equal
// to the one that was written.
TimePoint NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);

} // namespace workgraph::util
