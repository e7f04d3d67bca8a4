#pragma once

#include <string>
#include <vector>

#include "bench/AttributeMatcher.hpp"
#include "bench/Models.hpp"
#include "common/Json.hpp"
#include "runtime/SkillRuntime.hpp"
#include "store/SkillRepository.hpp"

namespace bench {

struct ResultQuery {
    std::vector<ResultStatus> statuses;    // empty = any
    std::vector<Difficulty> difficulties;  // empty = any
    size_t limit = 100;
    size_t offset = 0;
};

struct ResultPage {
    std::vector<Result> results;
    size_t total = 0;  // matches before paging
};

struct FailedCase {
    Case test_case;
    Result result;

    common::json to_json() const;
};

// "RUN_YYYYMMDDHHMMSS_XXXXXX"
std::string new_run_code();

// Runs every active case of a dataset through a MaterialParser and scores the
// output. Per-case failures become `error` results; only structural problems
// (unknown ids, a run already running) reach the caller.
class EvaluationService {
public:
    EvaluationService(store::SkillRepository& repo, runtime::MaterialParser& parser, int batch_size = 10);

    // throws NotFoundError, DatasetEmpty, or std::runtime_error for an archived dataset
    Run create_run(const std::string& dataset_id, const EvaluationConfig& cfg = EvaluationConfig{},
                   const std::string& name = "", const std::string& description = "");

    // Completed runs are returned unchanged. A failed run resumes with the
    // cases that have no result yet. Throws RunAlreadyInProgress.
    Run execute_run(const std::string& run_id);

    // throws RunNotCompleted before completion
    Metrics get_run_metrics(const std::string& run_id) const;

    ResultPage get_run_results(const std::string& run_id, const ResultQuery& query = ResultQuery{}) const;

    // failed and error results joined with their cases
    std::vector<FailedCase> get_failed_cases(const std::string& run_id) const;

private:
    store::SkillRepository& m_repo;
    runtime::MaterialParser& m_parser;
    int m_batch_size;

    Run load_run(const std::string& run_id) const;
    Result evaluate_case(const Run& run, const Case& c, const AttributeMatcher& matcher);
};

}  // namespace bench
