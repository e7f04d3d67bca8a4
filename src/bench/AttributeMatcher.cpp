#include "bench/AttributeMatcher.hpp"

#include <cmath>
#include <set>

#include "common/TextUtil.hpp"

namespace bench {

double char_overlap(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0.0;

    const std::vector<std::string> ca = textutil::utf8_chars(a);
    const std::vector<std::string> cb = textutil::utf8_chars(b);
    const std::set<std::string> sa(ca.begin(), ca.end());
    const std::set<std::string> sb(cb.begin(), cb.end());

    size_t common = 0;
    for (const auto& c : sa) {
        if (sb.count(c)) ++common;
    }
    const size_t uni = sa.size() + sb.size() - common;
    return uni ? static_cast<double>(common) / static_cast<double>(uni) : 0.0;
}

std::string normalize_value(const std::string& s) {
    return textutil::compact_key(textutil::trim(s));
}

AttributeMatcher::AttributeMatcher(EvaluationConfig cfg) : m_cfg(cfg) {}

MatchOutcome AttributeMatcher::match_value(const skill::Scalar& expected, const skill::Scalar& actual,
                                           std::optional<double> tolerance) const {
    if (actual.is_null()) return {false, 0.0, MatchType::Missing};

    if (expected == actual) return {true, 1.0, MatchType::Exact};

    if (expected.is_text() && actual.is_text() &&
        normalize_value(expected.as_text()) == normalize_value(actual.as_text())) {
        return {true, 1.0, MatchType::Normalized};
    }

    if (tolerance && *tolerance > 0.0) {
        auto exp_num = expected.numeric_value();
        auto act_num = actual.numeric_value();
        if (exp_num && act_num) {
            if (*exp_num == 0.0) {
                if (*act_num == 0.0) return {true, 1.0, MatchType::Exact};
            } else {
                const double err = std::fabs(*exp_num - *act_num) / std::fabs(*exp_num);
                if (err <= *tolerance) return {true, 1.0 - (err / *tolerance) * 0.5, MatchType::Tolerance};
            }
        }
    }

    if (m_cfg.partial_match) {
        const double overlap = char_overlap(expected.to_string(), actual.to_string());
        if (overlap > 0.5) return {false, overlap * 0.5, MatchType::Fuzzy};
    }

    return {false, 0.0, MatchType::Mismatch};
}

std::pair<AttributeScores, double> AttributeMatcher::match_attributes(const ExpectedAttributes& expected,
                                                                      const runtime::AttributeSet& actual) const {
    AttributeScores scores;
    double total = 0.0;

    for (const auto& [name, exp] : expected) {
        const runtime::ExtractedAttribute* act = actual.find(name);
        const skill::Scalar actual_value = act ? act->value : skill::Scalar();
        const std::optional<double> tol = exp.has_tolerance ? exp.tolerance : std::optional<double>(m_cfg.tolerance);

        const MatchOutcome m = match_value(exp.value, actual_value, tol);
        scores.emplace_back(name, AttributeScore{exp.value, actual_value, m.match, m.score, m.type});
        total += m.score;
    }

    for (const auto& [name, act] : actual) {
        if (!name.empty() && name[0] == '_') continue;
        bool was_expected = false;
        for (const auto& e : expected) {
            if (e.first == name) {
                was_expected = true;
                break;
            }
        }
        if (!was_expected) {
            scores.emplace_back("_extra_" + name, AttributeScore{skill::Scalar(), act.value, false, 0.0, MatchType::Extra});
        }
    }

    const double overall = expected.empty() ? 0.0 : total / static_cast<double>(expected.size());
    return {std::move(scores), overall};
}

}  // namespace bench
