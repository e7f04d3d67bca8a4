#include "runtime/SkillSelector.hpp"

#include <algorithm>
#include <regex>

#include "common/TextUtil.hpp"

using json = common::json;

namespace runtime {

json SkillSelection::to_json() const {
    json scores = json::object();
    for (const auto& [id, s] : all_scores) scores[id] = s;
    return {
        {"matched_skill", skill ? json(skill->skill_id) : json(nullptr)},
        {"confidence", score},
        {"all_scores", std::move(scores)}
    };
}

double intent_score(const std::string& text, const skill::SkillDsl& dsl) {
    if (!dsl.recognition) return 0.0;
    const auto& rec = *dsl.recognition;

    double score = 0.0;
    for (const auto& kw : rec.keywords) {
        if (!kw.empty() && textutil::contains_ci(text, kw)) score += 1.0;
    }
    for (const auto& cp : rec.compiled) {
        if (std::regex_search(text, cp.re)) score += 1.5;
    }

    // invalid patterns still count toward the denominator
    const double max_score = std::max<double>(static_cast<double>(rec.keywords.size() + rec.patterns.size()), 1.0);
    return std::min(score / max_score, 1.0);
}

SkillSelection select_skill(const std::string& text, const std::vector<skill::Skill>& skills) {
    std::vector<const skill::Skill*> pool;
    for (const auto& s : skills) {
        if (s.status == skill::SkillStatus::Active) pool.push_back(&s);
    }
    if (pool.empty()) {
        for (const auto& s : skills) pool.push_back(&s);
    }
    std::stable_sort(pool.begin(), pool.end(), [](const skill::Skill* a, const skill::Skill* b) {
        return a->priority > b->priority;
    });

    SkillSelection sel;
    sel.candidate_count = pool.size();

    const skill::Skill* best = nullptr;
    double best_score = 0.0;
    for (const skill::Skill* s : pool) {
        const double score = s->dsl ? intent_score(text, *s->dsl) : 0.0;
        sel.all_scores.emplace_back(s->skill_id, score);
        if (score > best_score) {
            best_score = score;
            best = s;
        }
    }

    if (best) sel.skill = *best;
    sel.score = best_score;
    return sel;
}

}  // namespace runtime
