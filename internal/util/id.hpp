#pragma once

#include <string>
#include <string_view>

namespace workgraph::util {

/*
  Work item id helpers.

  Generated ids look like "feat-3fa94c1e": a type prefix followed by
  8 random lowercase hex characters.
*/

std::string GenerateId(std::string_view prefix);

bool IsValidId(std::string_view id);

} // namespace workgraph::util
