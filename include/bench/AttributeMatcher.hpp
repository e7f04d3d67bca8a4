#pragma once

#include <optional>
#include <string>
#include <utility>

#include "bench/Models.hpp"
#include "runtime/Models.hpp"

namespace bench {

struct MatchOutcome {
    bool match = false;
    double score = 0.0;
    MatchType type = MatchType::Missing;
};

// Jaccard overlap of the two values' character sets (UTF-8 aware)
double char_overlap(const std::string& a, const std::string& b);

// lowercase, no spaces / hyphens / underscores
std::string normalize_value(const std::string& s);

class AttributeMatcher {
public:
    explicit AttributeMatcher(EvaluationConfig cfg = EvaluationConfig{});

    // First rule that applies: missing, exact, normalized (both text),
    // tolerance (relative error <= tol: 1 - 0.5 * err / tol), fuzzy (overlap
    // > 0.5, half credit, not a match), mismatch.
    MatchOutcome match_value(const skill::Scalar& expected, const skill::Scalar& actual,
                             std::optional<double> tolerance) const;

    // Scores every expected attribute; actual attributes nobody expected are
    // recorded as "_extra_<name>" and do not affect the score. Overall score is
    // the mean over expected attributes (0 when nothing was expected).
    std::pair<AttributeScores, double> match_attributes(const ExpectedAttributes& expected,
                                                        const runtime::AttributeSet& actual) const;

private:
    EvaluationConfig m_cfg;
};

}  // namespace bench
