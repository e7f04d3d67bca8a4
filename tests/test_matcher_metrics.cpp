#include <gtest/gtest.h>

#include "bench/AttributeMatcher.hpp"
#include "bench/Metrics.hpp"

using bench::MatchType;
using skill::Scalar;

namespace {

runtime::AttributeSet actual_of(std::initializer_list<std::pair<std::string, Scalar>> values) {
    runtime::AttributeSet out;
    for (const auto& [name, v] : values) {
        runtime::ExtractedAttribute a;
        a.value = v;
        a.confidence = runtime::kPatternConfidence;
        out.set(name, a);
    }
    return out;
}

bench::Result result_of(const std::string& case_id, bench::ResultStatus status, double score) {
    bench::Result r;
    r.case_id = case_id;
    r.status = status;
    r.overall_score = score;
    r.actual_confidence = 0.9;
    r.execution_time_ms = 10;
    return r;
}

}  // namespace

TEST(AttributeMatcher, ExactAndNormalized) {
    const bench::AttributeMatcher m;
    auto exact = m.match_value(Scalar(100), Scalar(100.0), 0.05);
    EXPECT_TRUE(exact.match);
    EXPECT_EQ(exact.type, MatchType::Exact);

    auto norm = m.match_value(Scalar("PVC-U"), Scalar("pvc u"), std::nullopt);
    EXPECT_TRUE(norm.match);
    EXPECT_EQ(norm.type, MatchType::Normalized);
    EXPECT_DOUBLE_EQ(norm.score, 1.0);
}

TEST(AttributeMatcher, ToleranceScoresLinearly) {
    const bench::AttributeMatcher m;
    auto near = m.match_value(Scalar(5.3), Scalar(5.4), 0.05);
    EXPECT_TRUE(near.match);
    EXPECT_EQ(near.type, MatchType::Tolerance);
    EXPECT_NEAR(near.score, 1.0 - (0.1 / 5.3) / 0.05 * 0.5, 1e-9);
    EXPECT_NEAR(near.score, 0.811, 0.001);

    auto edge = m.match_value(Scalar(100), Scalar(105), 0.05);
    EXPECT_TRUE(edge.match);
    EXPECT_NEAR(edge.score, 0.5, 1e-9);

    auto text_number = m.match_value(Scalar(4.2), Scalar("4.25"), 0.05);
    EXPECT_EQ(text_number.type, MatchType::Tolerance);
}

TEST(AttributeMatcher, ZeroExpectedOnlyMatchesZero) {
    const bench::AttributeMatcher m;
    EXPECT_EQ(m.match_value(Scalar(0.0), Scalar("0"), 0.05).type, MatchType::Exact);
    EXPECT_FALSE(m.match_value(Scalar(0), Scalar(0.01), 0.05).match);
}

TEST(AttributeMatcher, ToleranceDisabledFallsThrough) {
    const bench::AttributeMatcher m;
    auto r = m.match_value(Scalar(5.3), Scalar(5.4), std::nullopt);
    EXPECT_FALSE(r.match);
    EXPECT_NE(r.type, MatchType::Tolerance);
}

TEST(AttributeMatcher, FuzzyGivesHalfCreditWithoutMatching) {
    const bench::AttributeMatcher m;
    auto r = m.match_value(Scalar("S12.5"), Scalar("S12"), std::nullopt);
    EXPECT_FALSE(r.match);
    EXPECT_EQ(r.type, MatchType::Fuzzy);
    EXPECT_NEAR(r.score, 0.3, 1e-9);

    bench::EvaluationConfig strict;
    strict.partial_match = false;
    EXPECT_EQ(bench::AttributeMatcher(strict).match_value(Scalar("S12.5"), Scalar("S12"), std::nullopt).type,
              MatchType::Mismatch);
}

TEST(AttributeMatcher, MissingAndCharOverlap) {
    const bench::AttributeMatcher m;
    EXPECT_EQ(m.match_value(Scalar(1), Scalar(), 0.05).type, MatchType::Missing);
    EXPECT_DOUBLE_EQ(bench::char_overlap("管材", "管件"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(bench::char_overlap("", "x"), 0.0);
}

TEST(AttributeMatcher, MatchAttributesAveragesAndRecordsExtras) {
    bench::ExpectedAttributes expected;
    expected.emplace_back("公称直径", bench::ExpectedAttribute{Scalar(100), "mm", false, std::nullopt});
    expected.emplace_back("材质", bench::ExpectedAttribute{Scalar("PVC-U"), "", false, std::nullopt});

    const auto actual = actual_of({{"公称直径", Scalar(100)}, {"公称外径", Scalar(110)}});
    const auto [scores, overall] = bench::AttributeMatcher().match_attributes(expected, actual);

    EXPECT_DOUBLE_EQ(overall, 0.5);
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_EQ(scores[1].second.type, MatchType::Missing);
    EXPECT_EQ(scores[2].first, "_extra_公称外径");
    EXPECT_EQ(scores[2].second.type, MatchType::Extra);
}

TEST(AttributeMatcher, PerAttributeToleranceOverridesRun) {
    bench::ExpectedAttributes expected;
    expected.emplace_back("最小壁厚", bench::ExpectedAttribute{Scalar(4.2), "mm", true, std::nullopt});
    const auto actual = actual_of({{"最小壁厚", Scalar(4.3)}});

    const auto [scores, overall] = bench::AttributeMatcher().match_attributes(expected, actual);
    EXPECT_NE(scores[0].second.type, MatchType::Tolerance);
    EXPECT_LT(overall, 0.5);

    bench::ExpectedAttributes loose;
    loose.emplace_back("最小壁厚", bench::ExpectedAttribute{Scalar(4.2), "mm", true, 0.1});
    EXPECT_EQ(bench::AttributeMatcher().match_attributes(loose, actual).first[0].second.type, MatchType::Tolerance);
}

TEST(AttributeMatcher, NothingExpectedScoresZero) {
    const auto [scores, overall] =
        bench::AttributeMatcher().match_attributes(bench::ExpectedAttributes{}, actual_of({{"x", Scalar(1)}}));
    EXPECT_DOUBLE_EQ(overall, 0.0);
    EXPECT_EQ(scores.size(), 1u);
}

TEST(Metrics, AggregatesByStatusDifficultyAndAttribute) {
    std::vector<bench::Result> results;
    results.push_back(result_of("c1", bench::ResultStatus::Success, 1.0));
    results.push_back(result_of("c2", bench::ResultStatus::Partial, 0.6));
    results.push_back(result_of("c3", bench::ResultStatus::Error, 0.0));
    results.push_back(result_of("c4", bench::ResultStatus::Failed, 0.2));
    results[0].skill_match = true;
    results[1].skill_match = true;
    results[3].skill_match = false;
    results[2].actual_confidence.reset();
    results[0].attribute_scores.emplace_back("公称直径", bench::AttributeScore{Scalar(100), Scalar(100), true, 1.0, MatchType::Exact});
    results[1].attribute_scores.emplace_back("公称直径", bench::AttributeScore{Scalar(100), Scalar(101), true, 0.9, MatchType::Tolerance});
    results[1].attribute_scores.emplace_back("_extra_材质", bench::AttributeScore{Scalar(), Scalar("PE"), false, 0.0, MatchType::Extra});

    const std::map<std::string, bench::Difficulty> diff = {
        {"c1", bench::Difficulty::Easy}, {"c2", bench::Difficulty::Easy}, {"c3", bench::Difficulty::Hard}};
    const bench::Metrics m = bench::compute_metrics(results, diff);

    EXPECT_EQ(m.overall.total_cases, 4);
    EXPECT_DOUBLE_EQ(m.overall.accuracy, 0.25);
    EXPECT_DOUBLE_EQ(m.overall.partial_accuracy, 0.5);
    EXPECT_DOUBLE_EQ(m.overall.skill_match_rate, 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.overall.avg_confidence, 0.9);
    EXPECT_DOUBLE_EQ(m.overall.avg_score, 0.45);

    EXPECT_EQ(m.by_status.at("error"), 1);
    EXPECT_EQ(m.by_difficulty.at("easy").count, 2);
    EXPECT_DOUBLE_EQ(m.by_difficulty.at("easy").partial_accuracy, 1.0);
    EXPECT_EQ(m.by_difficulty.at("unknown").count, 1);

    ASSERT_EQ(m.by_attribute.size(), 1u);
    const bench::AttributeMetrics& a = m.by_attribute.at("公称直径");
    EXPECT_EQ(a.total, 2);
    EXPECT_DOUBLE_EQ(a.exact_match, 0.5);
    EXPECT_DOUBLE_EQ(a.within_tolerance, 1.0);
}

TEST(Metrics, EmptyResults) {
    const bench::Metrics m = bench::compute_metrics({}, {});
    EXPECT_EQ(m.overall.total_cases, 0);
    EXPECT_TRUE(m.by_difficulty.empty());
}
