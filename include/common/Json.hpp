#pragma once

#include "nlohmann/json.hpp"

namespace common {

// Insertion-ordered JSON: attribute order and table column order are part
// of the DSL contract and must survive a load -> store cycle.
using json = nlohmann::ordered_json;

}  // namespace common
