#include "bench/Metrics.hpp"

namespace bench {

namespace {

struct DifficultyTally {
    int count = 0;
    int success = 0;
    int partial = 0;
    double score = 0.0;
};

struct AttributeTally {
    int total = 0;
    int exact = 0;
    int tolerance = 0;
    int missing = 0;
};

double ratio(double num, int den) {
    return den > 0 ? num / den : 0.0;
}

}  // namespace

Metrics compute_metrics(const std::vector<Result>& results, const std::map<std::string, Difficulty>& difficulty_by_case) {
    Metrics m;
    const int total = static_cast<int>(results.size());
    m.overall.total_cases = total;
    if (total == 0) return m;

    int success = 0, partial = 0;
    int skill_match = 0, skill_total = 0;
    int conf_n = 0;
    double score_sum = 0.0, conf_sum = 0.0, time_sum = 0.0;

    std::map<std::string, DifficultyTally> by_diff;
    std::map<std::string, AttributeTally> by_attr;

    for (const auto& r : results) {
        ++m.by_status[to_string(r.status)];

        const bool is_success = r.status == ResultStatus::Success;
        const bool is_partial = is_success || r.status == ResultStatus::Partial;
        if (is_success) ++success;
        if (is_partial) ++partial;

        if (r.skill_match) {
            ++skill_total;
            if (*r.skill_match) ++skill_match;
        }
        score_sum += r.overall_score;
        if (r.actual_confidence) {
            conf_sum += *r.actual_confidence;
            ++conf_n;
        }
        time_sum += static_cast<double>(r.execution_time_ms);

        auto it = difficulty_by_case.find(r.case_id);
        DifficultyTally& d = by_diff[it != difficulty_by_case.end() ? to_string(it->second) : "unknown"];
        ++d.count;
        if (is_success) ++d.success;
        if (is_partial) ++d.partial;
        d.score += r.overall_score;

        for (const auto& [name, s] : r.attribute_scores) {
            if (!name.empty() && name[0] == '_') continue;
            AttributeTally& a = by_attr[name];
            ++a.total;
            if (s.type == MatchType::Exact || s.type == MatchType::Normalized) {
                ++a.exact;
            } else if (s.type == MatchType::Tolerance) {
                ++a.tolerance;
            } else if (s.type == MatchType::Missing) {
                ++a.missing;
            }
        }
    }

    m.overall.accuracy = ratio(success, total);
    m.overall.partial_accuracy = ratio(partial, total);
    m.overall.skill_match_rate = ratio(skill_match, skill_total);
    m.overall.avg_confidence = ratio(conf_sum, conf_n);
    m.overall.avg_score = ratio(score_sum, total);
    m.overall.avg_execution_time_ms = ratio(time_sum, total);

    for (const auto& [name, d] : by_diff) {
        DifficultyMetrics dm;
        dm.count = d.count;
        dm.accuracy = ratio(d.success, d.count);
        dm.partial_accuracy = ratio(d.partial, d.count);
        dm.avg_score = ratio(d.score, d.count);
        m.by_difficulty[name] = dm;
    }
    for (const auto& [name, a] : by_attr) {
        AttributeMetrics am;
        am.total = a.total;
        am.exact_match = ratio(a.exact, a.total);
        am.within_tolerance = ratio(a.exact + a.tolerance, a.total);
        am.missing_rate = ratio(a.missing, a.total);
        m.by_attribute[name] = am;
    }
    return m;
}

}  // namespace bench
