#include "id.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace workgraph::util {

std::string GenerateId(std::string_view prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::ostringstream oss;
  oss << prefix << '-' << std::hex << std::setw(8) << std::setfill('0') << static_cast<uint32_t>(rng());
  return oss.str();
}

bool IsValidId(std::string_view id) {
  if (id.empty() || id.size() > 256) {
    return false;
  }
  // ids end up in log fields and SQL parameters; keep them printable
  return std::all_of(id.begin(), id.end(), [](char c) { return c > 0x20 && c < 0x7F; });
}

} // namespace workgraph::util
