#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "TestFixtures.hpp"
#include "common/Errors.hpp"
#include "store/InMemoryRepository.hpp"
#include "store/JsonDirRepository.hpp"

namespace fs = std::filesystem;
using common::json;

namespace {

class TempDir {
public:
    TempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() / ("gbskill_test_" + std::to_string(stamp));
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

void write_file(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    out << text;
}

}  // namespace

TEST(InMemoryRepository, PublishingVersionsChangedPayloads) {
    store::InMemoryRepository repo;
    const skill::Skill first = repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json(), skill::SkillStatus::Draft));
    EXPECT_EQ(first.dsl_version, "1.0.0");

    // same payload: metadata only
    const skill::Skill same = repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json(), skill::SkillStatus::Active));
    EXPECT_EQ(same.dsl_version, "1.0.0");
    EXPECT_EQ(repo.get_skill("SKILL_PIPE_TEST")->status, skill::SkillStatus::Active);

    json changed = testfx::pipe_dsl_json();
    changed["intentRecognition"]["keywords"].push_back("PVC-U");
    const skill::Skill second = repo.publish_skill(testfx::make_skill(changed));
    EXPECT_EQ(second.dsl_version, "1.1.0");

    EXPECT_EQ(repo.skill_versions("SKILL_PIPE_TEST").size(), 2u);
    EXPECT_EQ(repo.get_skill("SKILL_PIPE_TEST")->dsl_version, "1.1.0");
    EXPECT_EQ(repo.list_skills().size(), 1u);
}

TEST(InMemoryRepository, ListFiltersAndStatusChanges) {
    store::InMemoryRepository repo;
    repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json()));
    repo.publish_skill(testfx::make_skill(testfx::bolt_dsl_json(), skill::SkillStatus::Draft));

    EXPECT_EQ(repo.list_skills(std::string("fastener")).size(), 1u);
    EXPECT_EQ(repo.list_skills(std::nullopt, skill::SkillStatus::Active).size(), 1u);

    repo.set_skill_status("SKILL_BOLT_TEST", skill::SkillStatus::Active);
    EXPECT_EQ(repo.list_skills(std::nullopt, skill::SkillStatus::Active).size(), 2u);
    EXPECT_THROW(repo.set_skill_status("SKILL_NOPE", skill::SkillStatus::Active), common::NotFoundError);
    EXPECT_FALSE(repo.get_skill("SKILL_NOPE").has_value());
}

TEST(InMemoryRepository, ResultIdsAreSequential) {
    store::InMemoryRepository repo;
    bench::Result r;
    r.run_id = "RUN_1";
    r.case_id = "c1";
    const long long a = repo.append_benchmark_result(r);
    const long long b = repo.append_benchmark_result(r);
    EXPECT_EQ(b, a + 1);
    EXPECT_EQ(repo.list_results("RUN_1").size(), 2u);
    EXPECT_TRUE(repo.list_results("RUN_2").empty());
}

TEST(JsonDirRepository, CompareVersions) {
    EXPECT_EQ(store::compare_versions("1.10.0", "1.9.0"), 1);
    EXPECT_EQ(store::compare_versions("1.0", "1.0.0"), 0);
    EXPECT_EQ(store::compare_versions("0.9.9", "1.0.0"), -1);
}

TEST(JsonDirRepository, QuarantinesBrokenSkillFiles) {
    TempDir dir;
    json rec = {{"status", "active"}, {"dsl_content", testfx::pipe_dsl_json()}};
    write_file(dir.path() / "skills" / "SKILL_PIPE_TEST@1.0.0.json", rec.dump(2));
    write_file(dir.path() / "skills" / "broken.json", "{not json");
    write_file(dir.path() / "skills" / "no_payload.json", R"({"skill_id": "X"})");

    store::JsonDirRepository repo(dir.path());
    EXPECT_EQ(repo.list_skills().size(), 1u);
    EXPECT_EQ(repo.get_skill("SKILL_PIPE_TEST")->status, skill::SkillStatus::Active);
    EXPECT_EQ(repo.quarantined().size(), 2u);
}

TEST(JsonDirRepository, LatestVersionWinsOnLoad) {
    TempDir dir;
    json v1 = {{"status", "active"}, {"dsl_version", "1.9.0"}, {"dsl_content", testfx::pipe_dsl_json()}};
    json v2 = v1;
    v2["dsl_version"] = "1.10.0";
    v2["dsl_content"]["skillName"] = "新版";
    write_file(dir.path() / "skills" / "SKILL_PIPE_TEST@1.9.0.json", v1.dump());
    write_file(dir.path() / "skills" / "SKILL_PIPE_TEST@1.10.0.json", v2.dump());

    store::JsonDirRepository repo(dir.path());
    EXPECT_EQ(repo.get_skill("SKILL_PIPE_TEST")->dsl_version, "1.10.0");
    EXPECT_EQ(repo.skill_versions("SKILL_PIPE_TEST").size(), 2u);
}

TEST(JsonDirRepository, PersistsAcrossReopen) {
    TempDir dir;
    std::string run_id;
    {
        store::JsonDirRepository repo(dir.path());
        repo.publish_skill(testfx::make_skill(testfx::bolt_dsl_json()));

        bench::Dataset ds;
        ds.id = "ds1";
        ds.name = "bolts";
        ds.skill_id = "SKILL_BOLT_TEST";
        repo.update_dataset(ds);

        bench::Case c;
        c.id = "GEN_1";
        c.dataset_id = "ds1";
        c.input_text = "六角螺栓 M12×50 304";
        c.expected_attributes.emplace_back("规格", bench::ExpectedAttribute{skill::Scalar("M12×50"), "", false, std::nullopt});
        repo.append_cases({c});

        bench::Run run;
        run.id = "RUN_X";
        run.dataset_id = "ds1";
        run.status = bench::RunStatus::Completed;
        run.total_cases = 1;
        run.completed_cases = 1;
        run.created_at = common::Clock::now();
        repo.save_run(run);
        run_id = run.id;

        bench::Result r;
        r.run_id = run.id;
        r.case_id = c.id;
        r.status = bench::ResultStatus::Success;
        r.overall_score = 1.0;
        repo.append_benchmark_result(r);
    }

    store::JsonDirRepository reopened(dir.path());
    ASSERT_TRUE(reopened.get_skill("SKILL_BOLT_TEST").has_value());
    EXPECT_EQ(reopened.load_dataset("ds1")->skill_id.value_or(""), "SKILL_BOLT_TEST");

    const auto cases = reopened.load_cases("ds1");
    ASSERT_EQ(cases.size(), 1u);
    EXPECT_EQ(cases[0].input_text, "六角螺栓 M12×50 304");
    EXPECT_EQ(cases[0].expected_attributes[0].second.value, skill::Scalar("M12×50"));

    EXPECT_EQ(reopened.get_run(run_id)->status, bench::RunStatus::Completed);
    const auto results = reopened.list_results(run_id);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, bench::ResultStatus::Success);

    bench::Result next;
    next.run_id = run_id;
    next.case_id = "GEN_1";
    EXPECT_GT(reopened.append_benchmark_result(next), results[0].id);
}

TEST(JsonDirRepository, PublishWritesVersionedFile) {
    TempDir dir;
    store::JsonDirRepository repo(dir.path());
    repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json()));
    json changed = testfx::pipe_dsl_json();
    changed["skillName"] = "PVC-U管材(新)";
    repo.publish_skill(testfx::make_skill(changed));

    EXPECT_TRUE(fs::exists(dir.path() / "skills" / "SKILL_PIPE_TEST@1.0.0.json"));
    EXPECT_TRUE(fs::exists(dir.path() / "skills" / "SKILL_PIPE_TEST@1.1.0.json"));

    repo.set_skill_status("SKILL_PIPE_TEST", skill::SkillStatus::Deprecated);
    store::JsonDirRepository reopened(dir.path());
    EXPECT_EQ(reopened.get_skill("SKILL_PIPE_TEST")->status, skill::SkillStatus::Deprecated);
    EXPECT_EQ(reopened.get_skill("SKILL_PIPE_TEST")->dsl_version, "1.1.0");
}
