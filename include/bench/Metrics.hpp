#pragma once

#include <map>
#include <string>
#include <vector>

#include "bench/Models.hpp"

namespace bench {

// Run-level aggregates. `difficulty_by_case` maps case id -> difficulty;
// results of unknown cases are grouped under "unknown".
Metrics compute_metrics(const std::vector<Result>& results, const std::map<std::string, Difficulty>& difficulty_by_case);

}  // namespace bench
