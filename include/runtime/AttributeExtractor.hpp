#pragma once

#include <string>

#include "runtime/Models.hpp"
#include "skill/SkillDsl.hpp"

namespace runtime {

// For each declared attribute in order: the first pattern that matches wins
// (capture group 1 if the pattern has groups, else the whole match); no match
// falls back to defaultValue; neither means the attribute is omitted.
// Dimension attributes whose value is a plain decimal string become numbers.
AttributeSet extract_attributes(const std::string& text, const skill::SkillDsl& dsl);

}  // namespace runtime
