#include "bench/Models.hpp"

#include <stdexcept>

using json = common::json;

namespace bench {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return std::nullopt;
    return j.at(key).get<std::string>();
}

static json opt_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static json opt_time(const std::optional<common::TimePoint>& t) {
    return t ? json(common::to_epoch_ms(*t)) : json(nullptr);
}

static std::optional<common::TimePoint> time_at(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_number_integer()) return std::nullopt;
    return common::from_epoch_ms(j.at(key).get<long long>());
}

// ---------- enums ----------

const char* to_string(Difficulty d) {
    switch (d) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
        case Difficulty::Adversarial: return "adversarial";
    }
    return "easy";
}

const char* to_string(CaseSource s) {
    switch (s) {
        case CaseSource::Seed: return "seed";
        case CaseSource::TableEnum: return "table_enum";
        case CaseSource::Template: return "template";
        case CaseSource::Noise: return "noise";
    }
    return "seed";
}

const char* to_string(DatasetStatus s) {
    switch (s) {
        case DatasetStatus::Draft: return "draft";
        case DatasetStatus::Ready: return "ready";
        case DatasetStatus::Archived: return "archived";
    }
    return "draft";
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
    }
    return "pending";
}

const char* to_string(ResultStatus s) {
    switch (s) {
        case ResultStatus::Success: return "success";
        case ResultStatus::Partial: return "partial";
        case ResultStatus::Failed: return "failed";
        case ResultStatus::Error: return "error";
    }
    return "failed";
}

const char* to_string(MatchType t) {
    switch (t) {
        case MatchType::Exact: return "exact";
        case MatchType::Normalized: return "normalized";
        case MatchType::Tolerance: return "tolerance";
        case MatchType::Fuzzy: return "fuzzy";
        case MatchType::Mismatch: return "mismatch";
        case MatchType::Missing: return "missing";
        case MatchType::Extra: return "extra";
    }
    return "missing";
}

std::optional<Difficulty> parse_difficulty(const std::string& s) {
    for (Difficulty d : all_difficulties()) {
        if (s == to_string(d)) return d;
    }
    return std::nullopt;
}

std::optional<ResultStatus> parse_result_status(const std::string& s) {
    for (ResultStatus r : {ResultStatus::Success, ResultStatus::Partial, ResultStatus::Failed, ResultStatus::Error}) {
        if (s == to_string(r)) return r;
    }
    return std::nullopt;
}

static CaseSource parse_case_source(const std::string& s) {
    for (CaseSource c : {CaseSource::Seed, CaseSource::TableEnum, CaseSource::Template, CaseSource::Noise}) {
        if (s == to_string(c)) return c;
    }
    throw std::runtime_error("unknown case source_type: " + s);
}

static DatasetStatus parse_dataset_status(const std::string& s) {
    for (DatasetStatus d : {DatasetStatus::Draft, DatasetStatus::Ready, DatasetStatus::Archived}) {
        if (s == to_string(d)) return d;
    }
    throw std::runtime_error("unknown dataset status: " + s);
}

static RunStatus parse_run_status(const std::string& s) {
    for (RunStatus r : {RunStatus::Pending, RunStatus::Running, RunStatus::Completed, RunStatus::Failed}) {
        if (s == to_string(r)) return r;
    }
    throw std::runtime_error("unknown run status: " + s);
}

static MatchType parse_match_type(const std::string& s) {
    for (MatchType m : {MatchType::Exact, MatchType::Normalized, MatchType::Tolerance, MatchType::Fuzzy,
                        MatchType::Mismatch, MatchType::Missing, MatchType::Extra}) {
        if (s == to_string(m)) return m;
    }
    throw std::runtime_error("unknown match type: " + s);
}

const std::vector<Difficulty>& all_difficulties() {
    static const std::vector<Difficulty> all = {
        Difficulty::Easy, Difficulty::Medium, Difficulty::Hard, Difficulty::Adversarial
    };
    return all;
}

// ---------- ExpectedAttribute ----------

json ExpectedAttribute::to_json() const {
    json j = {{"value", value.to_json()}, {"unit", unit}};
    if (has_tolerance) j["tolerance"] = tolerance ? json(*tolerance) : json(nullptr);
    return j;
}

ExpectedAttribute ExpectedAttribute::from_json(const json& j) {
    ExpectedAttribute e;
    // a bare scalar is shorthand for {"value": scalar}
    if (!j.is_object()) {
        e.value = skill::Scalar::from_json(j);
        return e;
    }
    e.value = j.contains("value") ? skill::Scalar::from_json(j.at("value")) : skill::Scalar();
    e.unit = j.value("unit", "");
    if (j.contains("tolerance")) {
        e.has_tolerance = true;
        if (j.at("tolerance").is_number()) e.tolerance = j.at("tolerance").get<double>();
    }
    return e;
}

// ---------- Dataset ----------

json Dataset::to_json() const {
    json dist = json::object();
    for (const auto& [d, n] : difficulty_distribution) dist[d] = n;
    return {
        {"id", id},
        {"name", name},
        {"description", description},
        {"skill_id", opt_json(skill_id)},
        {"source_type", source_type},
        {"status", to_string(status)},
        {"difficulty_distribution", std::move(dist)},
        {"total_cases", total_cases}
    };
}

Dataset Dataset::from_json(const json& j) {
    require_object(j, "dataset");
    Dataset d;
    d.id = require_string(j, "id", "dataset");
    d.name = j.value("name", d.id);
    d.description = j.value("description", "");
    d.skill_id = optional_string(j, "skill_id");
    d.source_type = j.value("source_type", "generated");
    d.status = parse_dataset_status(j.value("status", "ready"));
    if (j.contains("difficulty_distribution") && j.at("difficulty_distribution").is_object()) {
        for (auto it = j.at("difficulty_distribution").begin(); it != j.at("difficulty_distribution").end(); ++it) {
            d.difficulty_distribution.emplace_back(it.key(), it.value().get<int>());
        }
    }
    d.total_cases = j.value("total_cases", 0);
    return d;
}

// ---------- Case ----------

json Case::to_json() const {
    json expected = json::object();
    for (const auto& [name, e] : expected_attributes) expected[name] = e.to_json();
    return {
        {"id", id},
        {"dataset_id", dataset_id},
        {"input_text", input_text},
        {"expected_skill_id", opt_json(expected_skill_id)},
        {"expected_attributes", std::move(expected)},
        {"expected_category", expected_category},
        {"difficulty", to_string(difficulty)},
        {"source_type", to_string(source_type)},
        {"source_reference", source_reference},
        {"tags", tags},
        {"is_active", is_active}
    };
}

Case Case::from_json(const json& j) {
    require_object(j, "case");
    const std::string where = "case " + j.value("id", std::string("?"));

    Case c;
    c.id = require_string(j, "id", where);
    c.dataset_id = require_string(j, "dataset_id", where);
    c.input_text = require_string(j, "input_text", where);
    c.expected_skill_id = optional_string(j, "expected_skill_id");
    if (j.contains("expected_attributes") && !j.at("expected_attributes").is_null()) {
        const json& ea = j.at("expected_attributes");
        require_object(ea, where + ".expected_attributes");
        for (auto it = ea.begin(); it != ea.end(); ++it) {
            c.expected_attributes.emplace_back(it.key(), ExpectedAttribute::from_json(it.value()));
        }
    }
    if (j.contains("expected_category")) c.expected_category = j.at("expected_category");

    const std::string diff = j.value("difficulty", "easy");
    auto d = parse_difficulty(diff);
    if (!d) throw std::runtime_error(where + ".difficulty is not a known level: " + diff);
    c.difficulty = *d;

    c.source_type = parse_case_source(j.value("source_type", "seed"));
    if (j.contains("source_reference")) c.source_reference = j.at("source_reference");
    if (j.contains("tags") && j.at("tags").is_array()) c.tags = j.at("tags").get<std::vector<std::string>>();
    c.is_active = j.value("is_active", true);
    return c;
}

// ---------- EvaluationConfig ----------

json EvaluationConfig::to_json() const {
    return {
        {"tolerance", tolerance},
        {"partial_match", partial_match},
        {"skip_skill_match", skip_skill_match}
    };
}

EvaluationConfig EvaluationConfig::from_json(const json& j) {
    EvaluationConfig c;
    if (!j.is_object()) return c;
    c.tolerance = j.value("tolerance", c.tolerance);
    c.partial_match = j.value("partial_match", c.partial_match);
    c.skip_skill_match = j.value("skip_skill_match", c.skip_skill_match);
    return c;
}

// ---------- Metrics ----------

json Metrics::to_json() const {
    json j = json::object();
    j["overall"] = {
        {"total_cases", overall.total_cases},
        {"accuracy", overall.accuracy},
        {"partial_accuracy", overall.partial_accuracy},
        {"skill_match_rate", overall.skill_match_rate},
        {"avg_confidence", overall.avg_confidence},
        {"avg_score", overall.avg_score},
        {"avg_execution_time_ms", overall.avg_execution_time_ms}
    };

    json by_diff = json::object();
    for (const auto& [d, m] : by_difficulty) {
        by_diff[d] = {
            {"count", m.count},
            {"accuracy", m.accuracy},
            {"partial_accuracy", m.partial_accuracy},
            {"avg_score", m.avg_score}
        };
    }
    j["by_difficulty"] = std::move(by_diff);

    json by_attr = json::object();
    for (const auto& [name, m] : by_attribute) {
        by_attr[name] = {
            {"total", m.total},
            {"exact_match", m.exact_match},
            {"within_tolerance", m.within_tolerance},
            {"missing_rate", m.missing_rate}
        };
    }
    j["by_attribute"] = std::move(by_attr);

    json by_st = json::object();
    for (const auto& [s, n] : by_status) by_st[s] = n;
    j["by_status"] = std::move(by_st);
    return j;
}

Metrics Metrics::from_json(const json& j) {
    require_object(j, "metrics");
    Metrics m;
    if (j.contains("overall")) {
        const json& o = j.at("overall");
        m.overall.total_cases = o.value("total_cases", 0);
        m.overall.accuracy = o.value("accuracy", 0.0);
        m.overall.partial_accuracy = o.value("partial_accuracy", 0.0);
        m.overall.skill_match_rate = o.value("skill_match_rate", 0.0);
        m.overall.avg_confidence = o.value("avg_confidence", 0.0);
        m.overall.avg_score = o.value("avg_score", 0.0);
        m.overall.avg_execution_time_ms = o.value("avg_execution_time_ms", 0.0);
    }
    if (j.contains("by_difficulty")) {
        for (auto it = j.at("by_difficulty").begin(); it != j.at("by_difficulty").end(); ++it) {
            DifficultyMetrics d;
            d.count = it.value().value("count", 0);
            d.accuracy = it.value().value("accuracy", 0.0);
            d.partial_accuracy = it.value().value("partial_accuracy", 0.0);
            d.avg_score = it.value().value("avg_score", 0.0);
            m.by_difficulty[it.key()] = d;
        }
    }
    if (j.contains("by_attribute")) {
        for (auto it = j.at("by_attribute").begin(); it != j.at("by_attribute").end(); ++it) {
            AttributeMetrics a;
            a.total = it.value().value("total", 0);
            a.exact_match = it.value().value("exact_match", 0.0);
            a.within_tolerance = it.value().value("within_tolerance", 0.0);
            a.missing_rate = it.value().value("missing_rate", 0.0);
            m.by_attribute[it.key()] = a;
        }
    }
    if (j.contains("by_status")) {
        for (auto it = j.at("by_status").begin(); it != j.at("by_status").end(); ++it) {
            m.by_status[it.key()] = it.value().get<int>();
        }
    }
    return m;
}

// ---------- Run ----------

json Run::to_json() const {
    return {
        {"id", id},
        {"dataset_id", dataset_id},
        {"name", name},
        {"description", description},
        {"config", config.to_json()},
        {"status", to_string(status)},
        {"total_cases", total_cases},
        {"completed_cases", completed_cases},
        {"metrics", metrics ? metrics->to_json() : json(nullptr)},
        {"error_message", opt_json(error_message)},
        {"created_at", common::to_epoch_ms(created_at)},
        {"started_at", opt_time(started_at)},
        {"completed_at", opt_time(completed_at)}
    };
}

Run Run::from_json(const json& j) {
    require_object(j, "run");
    Run r;
    r.id = require_string(j, "id", "run");
    r.dataset_id = require_string(j, "dataset_id", "run " + r.id);
    r.name = j.value("name", "");
    r.description = j.value("description", "");
    if (j.contains("config")) r.config = EvaluationConfig::from_json(j.at("config"));
    r.status = parse_run_status(j.value("status", "pending"));
    r.total_cases = j.value("total_cases", 0);
    r.completed_cases = j.value("completed_cases", 0);
    if (j.contains("metrics") && j.at("metrics").is_object()) r.metrics = Metrics::from_json(j.at("metrics"));
    r.error_message = optional_string(j, "error_message");
    r.created_at = common::from_epoch_ms(j.value("created_at", 0LL));
    r.started_at = time_at(j, "started_at");
    r.completed_at = time_at(j, "completed_at");
    return r;
}

// ---------- AttributeScore / Result ----------

json AttributeScore::to_json() const {
    return {
        {"expected", expected.to_json()},
        {"actual", actual.to_json()},
        {"match", match},
        {"score", score},
        {"type", to_string(type)}
    };
}

AttributeScore AttributeScore::from_json(const json& j) {
    require_object(j, "attribute score");
    AttributeScore s;
    s.expected = j.contains("expected") ? skill::Scalar::from_json(j.at("expected")) : skill::Scalar();
    s.actual = j.contains("actual") ? skill::Scalar::from_json(j.at("actual")) : skill::Scalar();
    s.match = j.value("match", false);
    s.score = j.value("score", 0.0);
    s.type = parse_match_type(j.value("type", "missing"));
    return s;
}

json Result::to_json() const {
    json scores = json::object();
    for (const auto& [name, s] : attribute_scores) scores[name] = s.to_json();
    return {
        {"id", id},
        {"run_id", run_id},
        {"case_id", case_id},
        {"actual_skill_id", opt_json(actual_skill_id)},
        {"actual_attributes", actual_attributes.to_json()},
        {"actual_category", actual_category},
        {"actual_confidence", actual_confidence ? json(*actual_confidence) : json(nullptr)},
        {"execution_time_ms", execution_time_ms},
        {"skill_match", skill_match ? json(*skill_match) : json(nullptr)},
        {"attribute_scores", std::move(scores)},
        {"overall_score", overall_score},
        {"status", to_string(status)},
        {"error_message", opt_json(error_message)}
    };
}

Result Result::from_json(const json& j) {
    require_object(j, "result");
    Result r;
    r.id = j.value("id", 0LL);
    r.run_id = require_string(j, "run_id", "result");
    r.case_id = require_string(j, "case_id", "result");
    r.actual_skill_id = optional_string(j, "actual_skill_id");
    if (j.contains("actual_attributes")) r.actual_attributes = runtime::AttributeSet::from_json(j.at("actual_attributes"));
    if (j.contains("actual_category")) r.actual_category = j.at("actual_category");
    if (j.contains("actual_confidence") && j.at("actual_confidence").is_number()) {
        r.actual_confidence = j.at("actual_confidence").get<double>();
    }
    r.execution_time_ms = j.value("execution_time_ms", 0LL);
    if (j.contains("skill_match") && j.at("skill_match").is_boolean()) r.skill_match = j.at("skill_match").get<bool>();
    if (j.contains("attribute_scores") && j.at("attribute_scores").is_object()) {
        for (auto it = j.at("attribute_scores").begin(); it != j.at("attribute_scores").end(); ++it) {
            r.attribute_scores.emplace_back(it.key(), AttributeScore::from_json(it.value()));
        }
    }
    r.overall_score = j.value("overall_score", 0.0);
    auto st = parse_result_status(j.value("status", "failed"));
    if (!st) throw std::runtime_error("result has unknown status: " + j.value("status", ""));
    r.status = *st;
    r.error_message = optional_string(j, "error_message");
    return r;
}

// ---------- GenerationTemplate ----------

json GenerationTemplate::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"domain", domain},
        {"pattern", pattern},
        {"variants", variants},
        {"noise_rules", noise_rules},
        {"is_active", is_active}
    };
}

GenerationTemplate GenerationTemplate::from_json(const json& j) {
    require_object(j, "template");
    GenerationTemplate t;
    t.id = require_string(j, "id", "template");
    const std::string where = "template " + t.id;
    t.name = j.value("name", t.id);
    t.domain = j.value("domain", "");
    t.pattern = require_string(j, "pattern", where);
    if (j.contains("variants")) {
        if (!j.at("variants").is_array()) throw std::runtime_error(where + ".variants must be an array");
        t.variants = j.at("variants").get<std::vector<std::string>>();
    }
    if (j.contains("noise_rules") && j.at("noise_rules").is_object()) t.noise_rules = j.at("noise_rules");
    t.is_active = j.value("is_active", true);
    return t;
}

}  // namespace bench
