#pragma once

#include <string>
#include <vector>

#include "common/Json.hpp"
#include "runtime/Models.hpp"
#include "skill/SkillDsl.hpp"

namespace runtime {

struct AppliedRule {
    std::string rule;
    std::string source_value;
    std::string target;
};

struct RuleOutcome {
    size_t rule_count = 0;
    std::vector<AppliedRule> applied;

    common::json input_json() const;
    common::json output_json() const;
};

// A rule fires only when its source attribute is present and its mapping (or
// mapping table, first column -> second column) has the source value. Fired
// rules only ever add new attribute names; an existing target is left alone.
RuleOutcome apply_rules(AttributeSet& attrs, const skill::SkillDsl& dsl);

}  // namespace runtime
