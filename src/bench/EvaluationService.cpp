#include "bench/EvaluationService.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <random>
#include <set>
#include <stdexcept>

#include "bench/Metrics.hpp"
#include "bench/Random.hpp"
#include "common/Clock.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"

using json = common::json;

namespace bench {

json FailedCase::to_json() const {
    json expected = json::object();
    for (const auto& [name, e] : test_case.expected_attributes) expected[name] = e.to_json();
    json scores = json::object();
    for (const auto& [name, s] : result.attribute_scores) scores[name] = s.to_json();

    return {
        {"case_code", test_case.id},
        {"input_text", test_case.input_text},
        {"difficulty", to_string(test_case.difficulty)},
        {"expected_skill_id", test_case.expected_skill_id ? json(*test_case.expected_skill_id) : json(nullptr)},
        {"expected_attributes", std::move(expected)},
        {"actual_skill_id", result.actual_skill_id ? json(*result.actual_skill_id) : json(nullptr)},
        {"actual_attributes", result.actual_attributes.to_json()},
        {"attribute_scores", std::move(scores)},
        {"overall_score", result.overall_score},
        {"status", to_string(result.status)},
        {"error_message", result.error_message ? json(*result.error_message) : json(nullptr)},
        {"source_reference", test_case.source_reference}
    };
}

std::string new_run_code() {
    static thread_local Rng rng{std::random_device{}()};
    return "RUN_" + common::format_utc(common::Clock::now(), "%Y%m%d%H%M%S") + "_" + random_hex(rng, 6);
}

static std::vector<Case> active_cases(const store::SkillRepository& repo, const std::string& dataset_id) {
    std::vector<Case> cases = repo.load_cases(dataset_id);
    cases.erase(std::remove_if(cases.begin(), cases.end(), [](const Case& c) { return !c.is_active; }), cases.end());
    return cases;
}

static ResultStatus status_for(const std::optional<bool>& skill_match, double score) {
    if (skill_match && !*skill_match) return ResultStatus::Failed;
    if (score >= 0.9) return ResultStatus::Success;
    if (score >= 0.5) return ResultStatus::Partial;
    return ResultStatus::Failed;
}

EvaluationService::EvaluationService(store::SkillRepository& repo, runtime::MaterialParser& parser, int batch_size)
    : m_repo(repo), m_parser(parser), m_batch_size(std::max(batch_size, 1)) {}

Run EvaluationService::load_run(const std::string& run_id) const {
    std::optional<Run> run = m_repo.get_run(run_id);
    if (!run) throw common::NotFoundError("run", run_id);
    return *run;
}

Run EvaluationService::create_run(const std::string& dataset_id, const EvaluationConfig& cfg, const std::string& name,
                                  const std::string& description) {
    std::optional<Dataset> ds = m_repo.load_dataset(dataset_id);
    if (!ds) throw common::NotFoundError("dataset", dataset_id);
    if (ds->status == DatasetStatus::Archived) {
        throw std::runtime_error("cannot run a benchmark on archived dataset " + dataset_id);
    }

    const size_t n = active_cases(m_repo, dataset_id).size();
    if (n == 0) throw common::DatasetEmpty(dataset_id);

    Run run;
    run.id = new_run_code();
    run.dataset_id = dataset_id;
    run.created_at = common::Clock::now();
    run.name = name.empty() ? "Benchmark Run " + common::format_utc(run.created_at, "%Y-%m-%d %H:%M") : name;
    run.description = description;
    run.config = cfg;
    run.status = RunStatus::Pending;
    run.total_cases = static_cast<int>(n);
    m_repo.save_run(run);
    return run;
}

Result EvaluationService::evaluate_case(const Run& run, const Case& c, const AttributeMatcher& matcher) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    };

    Result r;
    r.run_id = run.id;
    r.case_id = c.id;

    try {
        runtime::ParseResponse resp = m_parser.execute(c.input_text, "bench_" + run.id + "_" + c.id);
        r.execution_time_ms = elapsed_ms();

        r.actual_skill_id = resp.matched_skill_id;
        r.actual_attributes = resp.result.attributes;
        r.actual_category = resp.result.category.to_json();
        r.actual_confidence = resp.result.confidence_score;

        if (!run.config.skip_skill_match && c.expected_skill_id) {
            r.skill_match = resp.matched_skill_id == c.expected_skill_id;
        }

        auto [scores, overall] = matcher.match_attributes(c.expected_attributes, r.actual_attributes);
        r.attribute_scores = std::move(scores);
        r.overall_score = overall;
        r.status = status_for(r.skill_match, overall);
    } catch (const std::exception& e) {
        r.execution_time_ms = elapsed_ms();
        r.status = ResultStatus::Error;
        r.error_message = e.what();
        logging::warn("Evaluation", "case " + c.id + " of run " + run.id + " failed: " + e.what());
    }
    return r;
}

Run EvaluationService::execute_run(const std::string& run_id) {
    Run run = load_run(run_id);
    if (run.status == RunStatus::Completed) return run;
    if (run.status == RunStatus::Running) throw common::RunAlreadyInProgress(run_id);

    run.status = RunStatus::Running;
    run.started_at = common::Clock::now();
    run.error_message.reset();
    m_repo.save_run(run);

    try {
        const AttributeMatcher matcher(run.config);
        const std::vector<Case> cases = active_cases(m_repo, run.dataset_id);

        // results left by an earlier failed attempt count as done
        std::set<std::string> done;
        for (const auto& r : m_repo.list_results(run.id)) done.insert(r.case_id);

        int completed = static_cast<int>(done.size());
        for (const auto& c : cases) {
            if (done.count(c.id)) continue;

            m_repo.append_benchmark_result(evaluate_case(run, c, matcher));
            ++completed;

            if (completed % m_batch_size == 0) {
                run.completed_cases = completed;
                m_repo.save_run(run);
            }
        }

        std::map<std::string, Difficulty> difficulty_by_case;
        for (const auto& c : cases) difficulty_by_case[c.id] = c.difficulty;

        run.metrics = compute_metrics(m_repo.list_results(run.id), difficulty_by_case);
        run.status = RunStatus::Completed;
        run.completed_at = common::Clock::now();
        run.completed_cases = completed;
        m_repo.save_run(run);

        logging::info("Evaluation", "run " + run.id + " completed: " + std::to_string(completed) + " case(s)");
        return run;
    } catch (const std::exception& e) {
        run.status = RunStatus::Failed;
        run.error_message = e.what();
        m_repo.save_run(run);
        logging::warn("Evaluation", "run " + run.id + " failed: " + e.what());
        throw;
    }
}

Metrics EvaluationService::get_run_metrics(const std::string& run_id) const {
    Run run = load_run(run_id);
    if (run.status != RunStatus::Completed || !run.metrics) throw common::RunNotCompleted(run_id);
    return *run.metrics;
}

ResultPage EvaluationService::get_run_results(const std::string& run_id, const ResultQuery& query) const {
    Run run = load_run(run_id);

    std::map<std::string, Difficulty> difficulty_by_case;
    if (!query.difficulties.empty()) {
        for (const auto& c : m_repo.load_cases(run.dataset_id)) difficulty_by_case[c.id] = c.difficulty;
    }

    std::vector<Result> matched;
    for (auto& r : m_repo.list_results(run_id)) {
        if (!query.statuses.empty() &&
            std::find(query.statuses.begin(), query.statuses.end(), r.status) == query.statuses.end()) {
            continue;
        }
        if (!query.difficulties.empty()) {
            auto it = difficulty_by_case.find(r.case_id);
            if (it == difficulty_by_case.end()) continue;
            if (std::find(query.difficulties.begin(), query.difficulties.end(), it->second) == query.difficulties.end()) {
                continue;
            }
        }
        matched.push_back(std::move(r));
    }

    ResultPage page;
    page.total = matched.size();
    const size_t begin = std::min(query.offset, matched.size());
    const size_t end = std::min(begin + query.limit, matched.size());
    page.results.assign(std::make_move_iterator(matched.begin() + begin), std::make_move_iterator(matched.begin() + end));
    return page;
}

std::vector<FailedCase> EvaluationService::get_failed_cases(const std::string& run_id) const {
    Run run = load_run(run_id);

    std::map<std::string, Case> case_by_id;
    for (auto& c : m_repo.load_cases(run.dataset_id)) case_by_id.emplace(c.id, std::move(c));

    std::vector<FailedCase> out;
    for (auto& r : m_repo.list_results(run_id)) {
        if (r.status != ResultStatus::Failed && r.status != ResultStatus::Error) continue;
        auto it = case_by_id.find(r.case_id);
        if (it == case_by_id.end()) continue;
        out.push_back({it->second, std::move(r)});
    }
    return out;
}

}  // namespace bench
