#pragma once

#include <string>
#include <vector>

namespace strata::runtime {

/// One CSV record as raw cell text.
using Row = std::vector<std::string>;

/// Ordered column names from the header record.
using Header = std::vector<std::string>;

}  // namespace strata::runtime
