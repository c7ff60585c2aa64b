#include "time.hpp"

namespace workgraph::util {

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

TimePoint NowMillis() {
  return FromUnixMillis(ToUnixMillis(Clock::now()));
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto ms = ToUnixMillis(tp);

  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1'000'000));
  return ts;
}

} // namespace workgraph::util
