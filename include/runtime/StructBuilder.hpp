#pragma once

#include <string>

#include "runtime/Models.hpp"
#include "skill/SkillDsl.hpp"

namespace runtime {

// Category is static per skill; nothing about the input affects it.
CategoryInfo map_category(const skill::SkillDsl& dsl);

// mean attribute confidence, 0.5 for an empty set, rounded to 3 decimals
double aggregate_confidence(const AttributeSet& attrs);

// material + ("管" for pipe, else "件") + "DN{diameter}"; the first 20
// characters of the input when neither material nor diameter is known
std::string synthesize_name(const std::string& input, const AttributeSet& attrs, const skill::SkillDsl& dsl,
                            const AttributeNames& names = AttributeNames{});

MaterialResult build_struct(const std::string& input, AttributeSet attrs, CategoryInfo category,
                            const skill::SkillDsl& dsl, const AttributeNames& names = AttributeNames{});

// result when no skill matched
MaterialResult default_result(const std::string& input);

}  // namespace runtime
