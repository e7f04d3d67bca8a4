#include <gtest/gtest.h>

#include <map>
#include <regex>
#include <set>
#include <stdexcept>

#include "TestFixtures.hpp"
#include "bench/DataGenerator.hpp"
#include "bench/EvaluationService.hpp"
#include "common/Errors.hpp"
#include "runtime/SkillRuntime.hpp"
#include "store/InMemoryRepository.hpp"

using skill::Scalar;

namespace {

// Answers from a fixed table; "boom" throws.
class FakeParser : public runtime::MaterialParser {
public:
    runtime::ParseResponse execute(const std::string& input_text, const std::string& trace_id) override {
        ++calls;
        if (input_text == "boom") throw std::runtime_error("parser exploded");

        runtime::ParseResponse resp;
        resp.trace_id = trace_id;
        resp.matched_skill_id = "SKILL_PIPE_TEST";
        auto it = answers.find(input_text);
        if (it != answers.end()) {
            runtime::ExtractedAttribute a;
            a.value = it->second;
            a.confidence = runtime::kPatternConfidence;
            resp.result.attributes.set("公称直径", a);
        }
        resp.result.confidence_score = 0.9;
        return resp;
    }

    std::map<std::string, Scalar> answers;
    int calls = 0;
};

// Fails the n-th result write (1-based) once.
class FlakyRepository : public store::InMemoryRepository {
public:
    long long append_benchmark_result(const bench::Result& result) override {
        if (++writes == fail_at) throw std::runtime_error("disk full");
        return InMemoryRepository::append_benchmark_result(result);
    }

    int writes = 0;
    int fail_at = -1;
};

bench::Case make_case(const std::string& id, const std::string& text, Scalar dn,
                      bench::Difficulty d = bench::Difficulty::Easy) {
    bench::Case c;
    c.id = id;
    c.dataset_id = "ds1";
    c.input_text = text;
    c.expected_skill_id = "SKILL_PIPE_TEST";
    c.expected_attributes.emplace_back("公称直径", bench::ExpectedAttribute{std::move(dn), "mm", false, std::nullopt});
    c.difficulty = d;
    return c;
}

void seed_dataset(store::InMemoryRepository& repo) {
    bench::Dataset ds;
    ds.id = "ds1";
    ds.name = "three";
    repo.update_dataset(ds);
    repo.append_cases({
        make_case("c1", "PVC管 DN100", Scalar(100)),
        make_case("c2", "boom", Scalar(50), bench::Difficulty::Hard),
        make_case("c3", "PVC管 DN150", Scalar(150), bench::Difficulty::Medium),
    });
}

}  // namespace

TEST(EvaluationService, RunCodesCarryTimestampAndHexSuffix) {
    const std::regex shape("RUN_\\d{14}_[0-9A-F]{6}");
    const std::string a = bench::new_run_code();
    const std::string b = bench::new_run_code();
    EXPECT_TRUE(std::regex_match(a, shape)) << a;
    EXPECT_TRUE(std::regex_match(b, shape)) << b;
    EXPECT_NE(a, b);
}

TEST(EvaluationService, RunScoresEveryCaseAndIsolatesFailures) {
    store::InMemoryRepository repo;
    seed_dataset(repo);
    FakeParser parser;
    parser.answers = {{"PVC管 DN100", Scalar(100)}, {"PVC管 DN150", Scalar(151)}};
    bench::EvaluationService svc(repo, parser, 2);

    const bench::Run created = svc.create_run("ds1");
    EXPECT_EQ(created.status, bench::RunStatus::Pending);
    EXPECT_EQ(created.total_cases, 3);
    EXPECT_EQ(created.id.rfind("RUN_", 0), 0u);
    EXPECT_EQ(created.name.rfind("Benchmark Run ", 0), 0u);

    const bench::Run done = svc.execute_run(created.id);
    EXPECT_EQ(done.status, bench::RunStatus::Completed);
    EXPECT_EQ(done.completed_cases, 3);
    ASSERT_TRUE(done.metrics.has_value());
    EXPECT_EQ(done.metrics->by_status.at("error"), 1);

    const auto results = repo.list_results(created.id);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].status, bench::ResultStatus::Success);
    EXPECT_EQ(results[1].status, bench::ResultStatus::Error);
    EXPECT_EQ(results[1].error_message.value_or(""), "parser exploded");
    // 150 vs 151: tolerance match
    EXPECT_EQ(results[2].status, bench::ResultStatus::Success);
    EXPECT_NEAR(results[2].overall_score, 1.0 - 0.5 * (1.0 / 150.0) / 0.05, 1e-9);
    EXPECT_EQ(results[0].skill_match.value_or(false), true);

    const bench::Metrics m = svc.get_run_metrics(created.id);
    EXPECT_EQ(m.overall.total_cases, 3);
    EXPECT_NEAR(m.overall.accuracy, 2.0 / 3.0, 1e-9);
}

TEST(EvaluationService, CompletedRunIsNotReExecuted) {
    store::InMemoryRepository repo;
    seed_dataset(repo);
    FakeParser parser;
    bench::EvaluationService svc(repo, parser);

    const std::string id = svc.create_run("ds1").id;
    svc.execute_run(id);
    const int calls = parser.calls;

    const bench::Run again = svc.execute_run(id);
    EXPECT_EQ(again.status, bench::RunStatus::Completed);
    EXPECT_EQ(parser.calls, calls);
    EXPECT_EQ(repo.list_results(id).size(), 3u);
}

TEST(EvaluationService, RunningRunIsRejected) {
    store::InMemoryRepository repo;
    seed_dataset(repo);
    FakeParser parser;
    bench::EvaluationService svc(repo, parser);

    bench::Run run = svc.create_run("ds1");
    run.status = bench::RunStatus::Running;
    repo.save_run(run);
    EXPECT_THROW(svc.execute_run(run.id), common::RunAlreadyInProgress);
}

TEST(EvaluationService, FailedRunResumesWithoutDuplicates) {
    FlakyRepository repo;
    seed_dataset(repo);
    repo.fail_at = 2;
    FakeParser parser;
    bench::EvaluationService svc(repo, parser);

    const std::string id = svc.create_run("ds1").id;
    EXPECT_THROW(svc.execute_run(id), std::runtime_error);
    const auto failed = repo.get_run(id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, bench::RunStatus::Failed);
    EXPECT_EQ(failed->error_message.value_or(""), "disk full");
    EXPECT_EQ(repo.list_results(id).size(), 1u);

    const bench::Run resumed = svc.execute_run(id);
    EXPECT_EQ(resumed.status, bench::RunStatus::Completed);
    EXPECT_EQ(resumed.completed_cases, 3);
    EXPECT_FALSE(resumed.error_message.has_value());

    const auto results = repo.list_results(id);
    ASSERT_EQ(results.size(), 3u);
    std::set<std::string> ids;
    for (const auto& r : results) ids.insert(r.case_id);
    EXPECT_EQ(ids.size(), 3u);
}

TEST(EvaluationService, CreateRunChecksDataset) {
    store::InMemoryRepository repo;
    FakeParser parser;
    bench::EvaluationService svc(repo, parser);
    EXPECT_THROW(svc.create_run("nope"), common::NotFoundError);

    bench::Dataset empty;
    empty.id = "empty";
    repo.update_dataset(empty);
    EXPECT_THROW(svc.create_run("empty"), common::DatasetEmpty);

    seed_dataset(repo);
    bench::Dataset ds = *repo.load_dataset("ds1");
    ds.status = bench::DatasetStatus::Archived;
    repo.update_dataset(ds);
    EXPECT_THROW(svc.create_run("ds1"), std::runtime_error);
}

TEST(EvaluationService, MetricsRequireCompletion) {
    store::InMemoryRepository repo;
    seed_dataset(repo);
    FakeParser parser;
    bench::EvaluationService svc(repo, parser);

    const std::string id = svc.create_run("ds1").id;
    EXPECT_THROW(svc.get_run_metrics(id), common::RunNotCompleted);
    EXPECT_THROW(svc.get_run_metrics("RUN_missing"), common::NotFoundError);
}

TEST(EvaluationService, ResultQueriesAndFailedCases) {
    store::InMemoryRepository repo;
    seed_dataset(repo);
    FakeParser parser;
    parser.answers = {{"PVC管 DN100", Scalar(100)}};
    bench::EvaluationService svc(repo, parser);

    const std::string id = svc.create_run("ds1").id;
    svc.execute_run(id);

    bench::ResultQuery errors;
    errors.statuses = {bench::ResultStatus::Error};
    const bench::ResultPage page = svc.get_run_results(id, errors);
    ASSERT_EQ(page.total, 1u);
    EXPECT_EQ(page.results[0].case_id, "c2");

    bench::ResultQuery medium;
    medium.difficulties = {bench::Difficulty::Medium};
    EXPECT_EQ(svc.get_run_results(id, medium).results[0].case_id, "c3");

    bench::ResultQuery paged;
    paged.limit = 1;
    paged.offset = 2;
    const bench::ResultPage p = svc.get_run_results(id, paged);
    EXPECT_EQ(p.total, 3u);
    ASSERT_EQ(p.results.size(), 1u);
    EXPECT_EQ(p.results[0].case_id, "c3");

    // c2 errored, c3 had no 公称直径 in the answer
    const auto failed = svc.get_failed_cases(id);
    ASSERT_EQ(failed.size(), 2u);
    EXPECT_EQ(failed[0].test_case.id, "c2");
    EXPECT_EQ(failed[1].result.attribute_scores[0].second.type, bench::MatchType::Missing);
    EXPECT_EQ(failed[0].to_json().at("status"), "error");
}

TEST(EvaluationService, SkillMismatchFailsRegardlessOfScore) {
    store::InMemoryRepository repo;
    bench::Dataset ds;
    ds.id = "ds1";
    repo.update_dataset(ds);
    bench::Case c = make_case("c1", "PVC管 DN100", Scalar(100));
    c.expected_skill_id = "SKILL_OTHER";
    repo.append_cases({c});

    FakeParser parser;
    parser.answers = {{"PVC管 DN100", Scalar(100)}};
    bench::EvaluationService svc(repo, parser);

    const std::string strict = svc.create_run("ds1").id;
    svc.execute_run(strict);
    EXPECT_EQ(repo.list_results(strict)[0].status, bench::ResultStatus::Failed);

    bench::EvaluationConfig lenient;
    lenient.skip_skill_match = true;
    const std::string skip = svc.create_run("ds1", lenient).id;
    svc.execute_run(skip);
    EXPECT_EQ(repo.list_results(skip)[0].status, bench::ResultStatus::Success);
    EXPECT_FALSE(repo.list_results(skip)[0].skill_match.has_value());
}

TEST(EvaluationService, GeneratedEasyCasesPassThroughTheRuntime) {
    store::InMemoryRepository repo;
    repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json()));
    bench::Dataset ds;
    ds.id = "gen";
    repo.update_dataset(ds);

    bench::GenerationOptions o;
    o.skill_id = "SKILL_PIPE_TEST";
    o.count = 8;
    o.difficulty_distribution = {{"easy", 100}};
    o.include_noise = false;
    o.include_variants = false;
    bench::DataGenerator(repo).generate_from_skill(o, "gen");

    runtime::SkillRuntime rt(repo);
    bench::EvaluationService svc(repo, rt);
    const std::string id = svc.create_run("gen").id;
    const bench::Run run = svc.execute_run(id);

    ASSERT_TRUE(run.metrics.has_value());
    EXPECT_DOUBLE_EQ(run.metrics->overall.accuracy, 1.0);
    EXPECT_DOUBLE_EQ(run.metrics->overall.skill_match_rate, 1.0);
    EXPECT_EQ(repo.list_execution_records().size(), 8u);
}
