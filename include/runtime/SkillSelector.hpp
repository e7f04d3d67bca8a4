#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Json.hpp"
#include "skill/Skill.hpp"

namespace runtime {

struct SkillSelection {
    std::optional<skill::Skill> skill;                        // nullopt: no skill matched
    double score = 0.0;
    size_t candidate_count = 0;
    std::vector<std::pair<std::string, double>> all_scores;  // skill_id -> score, evaluation order

    common::json to_json() const;
};

// min(1, (keyword_hits * 1.0 + pattern_hits * 1.5) / max(1, |keywords| + |patterns|))
double intent_score(const std::string& text, const skill::SkillDsl& dsl);

// Scores active skills (all skills if none is active), highest priority first.
// Only a strictly better score replaces the current best, so ties keep the
// higher-priority skill and a zero score never matches.
SkillSelection select_skill(const std::string& text, const std::vector<skill::Skill>& skills);

}  // namespace runtime
