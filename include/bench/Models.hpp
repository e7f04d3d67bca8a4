#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Clock.hpp"
#include "common/Json.hpp"
#include "runtime/Models.hpp"
#include "skill/Scalar.hpp"

namespace bench {

enum class Difficulty { Easy, Medium, Hard, Adversarial };
enum class CaseSource { Seed, TableEnum, Template, Noise };
enum class DatasetStatus { Draft, Ready, Archived };
enum class RunStatus { Pending, Running, Completed, Failed };
enum class ResultStatus { Success, Partial, Failed, Error };
enum class MatchType { Exact, Normalized, Tolerance, Fuzzy, Mismatch, Missing, Extra };

const char* to_string(Difficulty d);
const char* to_string(CaseSource s);
const char* to_string(DatasetStatus s);
const char* to_string(RunStatus s);
const char* to_string(ResultStatus s);
const char* to_string(MatchType t);

std::optional<Difficulty> parse_difficulty(const std::string& s);
std::optional<ResultStatus> parse_result_status(const std::string& s);

// easy, medium, hard, adversarial
const std::vector<Difficulty>& all_difficulties();

struct ExpectedAttribute {
    skill::Scalar value;
    std::string unit;
    bool has_tolerance = false;       // an explicit tolerance (possibly null) overrides the run's
    std::optional<double> tolerance;  // null/0 disables tolerance matching

    common::json to_json() const;
    static ExpectedAttribute from_json(const common::json& j);
};

using ExpectedAttributes = std::vector<std::pair<std::string, ExpectedAttribute>>;

struct Dataset {
    std::string id;
    std::string name;
    std::string description;
    std::optional<std::string> skill_id;
    std::string source_type = "generated";  // seed | generated | mixed
    DatasetStatus status = DatasetStatus::Ready;
    std::vector<std::pair<std::string, int>> difficulty_distribution;
    int total_cases = 0;

    common::json to_json() const;
    static Dataset from_json(const common::json& j);
};

struct Case {
    std::string id;  // case code
    std::string dataset_id;
    std::string input_text;
    std::optional<std::string> expected_skill_id;
    ExpectedAttributes expected_attributes;
    common::json expected_category;  // null when unset
    Difficulty difficulty = Difficulty::Easy;
    CaseSource source_type = CaseSource::Seed;
    common::json source_reference;
    std::vector<std::string> tags;
    bool is_active = true;

    common::json to_json() const;
    static Case from_json(const common::json& j);
};

struct EvaluationConfig {
    double tolerance = 0.05;
    bool partial_match = true;
    bool skip_skill_match = false;

    common::json to_json() const;
    static EvaluationConfig from_json(const common::json& j);
};

struct OverallMetrics {
    int total_cases = 0;
    double accuracy = 0.0;
    double partial_accuracy = 0.0;
    double skill_match_rate = 0.0;
    double avg_confidence = 0.0;
    double avg_score = 0.0;
    double avg_execution_time_ms = 0.0;
};

struct DifficultyMetrics {
    int count = 0;
    double accuracy = 0.0;
    double partial_accuracy = 0.0;
    double avg_score = 0.0;
};

struct AttributeMetrics {
    int total = 0;
    double exact_match = 0.0;       // exact or normalized
    double within_tolerance = 0.0;  // exact or tolerance
    double missing_rate = 0.0;
};

struct Metrics {
    OverallMetrics overall;
    std::map<std::string, DifficultyMetrics> by_difficulty;
    std::map<std::string, AttributeMetrics> by_attribute;
    std::map<std::string, int> by_status;

    common::json to_json() const;
    static Metrics from_json(const common::json& j);
};

struct Run {
    std::string id;  // run code
    std::string dataset_id;
    std::string name;
    std::string description;
    EvaluationConfig config;
    RunStatus status = RunStatus::Pending;
    int total_cases = 0;
    int completed_cases = 0;
    std::optional<Metrics> metrics;
    std::optional<std::string> error_message;
    common::TimePoint created_at{};
    std::optional<common::TimePoint> started_at;
    std::optional<common::TimePoint> completed_at;

    common::json to_json() const;
    static Run from_json(const common::json& j);
};

struct AttributeScore {
    skill::Scalar expected;
    skill::Scalar actual;  // null when missing
    bool match = false;
    double score = 0.0;
    MatchType type = MatchType::Missing;

    common::json to_json() const;
    static AttributeScore from_json(const common::json& j);
};

using AttributeScores = std::vector<std::pair<std::string, AttributeScore>>;

struct Result {
    long long id = 0;  // assigned by the repository
    std::string run_id;
    std::string case_id;
    std::optional<std::string> actual_skill_id;
    runtime::AttributeSet actual_attributes;
    common::json actual_category;
    std::optional<double> actual_confidence;
    long long execution_time_ms = 0;
    std::optional<bool> skill_match;
    AttributeScores attribute_scores;
    double overall_score = 0.0;
    ResultStatus status = ResultStatus::Failed;
    std::optional<std::string> error_message;

    common::json to_json() const;
    static Result from_json(const common::json& j);
};

struct GenerationTemplate {
    std::string id;
    std::string name;
    std::string domain;
    std::string pattern;  // "{attr}" placeholders
    std::vector<std::string> variants;
    common::json noise_rules = common::json::object();
    bool is_active = true;

    common::json to_json() const;
    static GenerationTemplate from_json(const common::json& j);
};

}  // namespace bench
