#include <gtest/gtest.h>

#include "TestFixtures.hpp"
#include "bench/DataGenerator.hpp"
#include "bench/ExpressionTemplates.hpp"
#include "bench/ValueDomain.hpp"
#include "common/Errors.hpp"
#include "store/InMemoryRepository.hpp"

using skill::Scalar;

namespace {

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.publish_skill(testfx::make_skill(testfx::pipe_dsl_json()));
        bench::Dataset ds;
        ds.id = "ds1";
        ds.name = "pipes";
        repo.update_dataset(ds);
    }

    bench::GenerationOptions options(int count) const {
        bench::GenerationOptions o;
        o.skill_id = "SKILL_PIPE_TEST";
        o.count = count;
        return o;
    }

    store::InMemoryRepository repo;
};

}  // namespace

TEST(DifficultyPlan, DefaultSplit) {
    const auto plan = bench::difficulty_plan({}, 10);
    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0], std::make_pair(bench::Difficulty::Easy, 4));
    EXPECT_EQ(plan[1], std::make_pair(bench::Difficulty::Medium, 3));
    EXPECT_EQ(plan[2], std::make_pair(bench::Difficulty::Hard, 2));
    EXPECT_EQ(plan[3], std::make_pair(bench::Difficulty::Adversarial, 1));

    int sum = 0;
    for (const auto& [d, n] : bench::difficulty_plan({}, 7)) sum += n;
    EXPECT_EQ(sum, 7);
}

TEST(DifficultyPlan, CustomRemainderGoesToFirst) {
    const auto plan = bench::difficulty_plan({{"bogus", 10}, {"hard", 30}, {"easy", 50}}, 10);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0], std::make_pair(bench::Difficulty::Hard, 5));
    EXPECT_EQ(plan[1], std::make_pair(bench::Difficulty::Easy, 5));
}

TEST(ValueDomain, CrossTableCombinationsRecoverDnAndPn) {
    const skill::SkillDsl dsl = skill::parse_skill_dsl(testfx::pipe_dsl_json());
    const bench::ValueDomainExtractor ex(dsl);
    const auto combos = ex.cross_table_combinations(100);

    // 2 + 3 + 3 non-null thickness cells
    ASSERT_EQ(combos.size(), 8u);
    const bench::ValueCombination& first = combos.front();
    EXPECT_EQ(*first.find("公称外径"), Scalar(50));
    EXPECT_EQ(*first.find("公称直径"), Scalar(50));
    EXPECT_EQ(*first.find("最小壁厚"), Scalar(2.4));
    EXPECT_EQ(*first.find("公称压力"), Scalar(1.0));
    EXPECT_EQ(first.source.at("col_index"), 2);

    EXPECT_EQ(ex.cross_table_combinations(3).size(), 3u);
}

TEST(ValueDomain, ExtractDomainsAndNormalizeColumns) {
    const skill::SkillDsl dsl = skill::parse_skill_dsl(testfx::pipe_dsl_json());
    const bench::ValueDomainExtractor ex(dsl);
    EXPECT_EQ(ex.normalize_column("公称外径dn").value_or(""), "公称外径");
    EXPECT_EQ(ex.normalize_column("长度(mm)").value_or(""), "长度");
    EXPECT_EQ(ex.normalize_column("颜色(色卡)").value_or(""), "颜色");
    EXPECT_FALSE(ex.normalize_column("").has_value());

    const bench::ValueDomains domains = ex.extract_all_domains();
    bool has_material = false;
    for (const auto& [name, values] : domains) {
        if (name == "材质") {
            has_material = true;
            ASSERT_EQ(values.size(), 1u);
            EXPECT_EQ(values[0], Scalar("PVC-U"));
        }
    }
    EXPECT_TRUE(has_material);
}

TEST(ValueDomain, ProductIsSampledDownToLimit) {
    bench::ValueDomains domains = {
        {"a", {Scalar(1), Scalar(2), Scalar(3)}},
        {"b", {Scalar("x"), Scalar("y")}},
    };
    bench::Rng rng(1);
    EXPECT_EQ(bench::combinations_from_domains(domains, 100, rng).size(), 6u);

    const auto sampled = bench::combinations_from_domains(domains, 4, rng);
    ASSERT_EQ(sampled.size(), 4u);
    for (size_t i = 0; i < sampled.size(); ++i) {
        for (size_t j = i + 1; j < sampled.size(); ++j) {
            EXPECT_FALSE(sampled[i].values == sampled[j].values);
        }
    }
}

TEST(ExpressionTemplates, RenderDropsUnknownPlaceholders) {
    bench::ValueCombination c;
    c.set("材质", Scalar("PE"));
    c.set("公称直径", Scalar(100));
    EXPECT_EQ(bench::ExpressionTemplateEngine::render("{材质}管 DN{公称直径} PN{公称压力}", c), "PE管 DN100 PN");
}

TEST(ExpressionTemplates, EasyUsesCanonicalTemplate) {
    bench::ValueCombination c;
    c.set("材质", Scalar("PVC-U"));
    c.set("公称直径", Scalar(50));
    c.set("公称压力", Scalar(1.0));
    const bench::ExpressionTemplateEngine engine("pipe");
    bench::Rng rng(42);
    EXPECT_EQ(engine.generate(c, bench::Difficulty::Easy, rng), "PVC-U管 DN50 PN1.0");
}

TEST(NoiseInjector, LevelsAndOverrides) {
    const bench::NoiseInjector defaults;
    EXPECT_DOUBLE_EQ(defaults.level(bench::Difficulty::Easy), 0.0);
    EXPECT_DOUBLE_EQ(defaults.level(bench::Difficulty::Adversarial), 0.6);

    const bench::NoiseInjector custom(common::json::parse(R"({"prefixes": ["急购"], "levels": {"easy": 1.0}})"));
    EXPECT_DOUBLE_EQ(custom.level(bench::Difficulty::Easy), 1.0);
    bench::Rng rng(7);
    EXPECT_EQ(custom.add_prefix("PE管", rng), "急购 PE管");

    bench::Rng rng2(3);
    const std::string swapped = bench::NoiseInjector::swap_adjacent("硬聚氯乙烯管", rng2);
    EXPECT_EQ(swapped.size(), std::string("硬聚氯乙烯管").size());
    EXPECT_NE(swapped, "硬聚氯乙烯管");
}

TEST_F(GeneratorTest, GeneratesPlannedCasesAndUpdatesDataset) {
    bench::DataGenerator gen(repo);
    const bench::GenerationResult res = gen.generate_from_skill(options(20), "ds1");

    EXPECT_EQ(res.generated_count, 20);
    EXPECT_EQ(res.stats.at("by_difficulty").at("easy"), 8);
    EXPECT_EQ(res.stats.at("by_difficulty").at("adversarial"), 2);
    EXPECT_EQ(res.stats.at("by_source").at("table_enum"), 20);
    EXPECT_EQ(res.stats.at("total_combinations"), 8);

    const auto cases = repo.load_cases("ds1");
    ASSERT_EQ(cases.size(), 20u);
    EXPECT_EQ(cases[0].id.rfind("GEN_", 0), 0u);
    EXPECT_EQ(cases[0].expected_skill_id.value_or(""), "SKILL_PIPE_TEST");
    EXPECT_EQ(cases[0].expected_category.at("primaryCategory"), "管材");

    bool saw_thickness = false;
    for (const auto& [name, e] : cases[0].expected_attributes) {
        if (name != "最小壁厚") continue;
        saw_thickness = true;
        EXPECT_EQ(e.unit, "mm");
        EXPECT_TRUE(e.has_tolerance);
        EXPECT_DOUBLE_EQ(e.tolerance.value_or(0.0), 0.05);
    }
    EXPECT_TRUE(saw_thickness);

    const auto ds = repo.load_dataset("ds1");
    ASSERT_TRUE(ds.has_value());
    EXPECT_EQ(ds->total_cases, 20);
}

TEST_F(GeneratorTest, SameSeedSameCases) {
    bench::DataGenerator gen(repo);
    const auto a = gen.generate_from_skill(options(12), "ds1");
    const auto b = gen.generate_from_skill(options(12), "ds1");

    ASSERT_EQ(a.cases.size(), b.cases.size());
    for (size_t i = 0; i < a.cases.size(); ++i) {
        EXPECT_EQ(a.cases[i].input_text, b.cases[i].input_text);
        EXPECT_NE(a.cases[i].id, b.cases[i].id);
    }
    EXPECT_EQ(repo.load_dataset("ds1")->total_cases, 24);
}

TEST_F(GeneratorTest, EasyWithoutNoiseIsCanonical) {
    bench::GenerationOptions o = options(3);
    o.difficulty_distribution = {{"easy", 100}};
    o.include_noise = false;
    o.include_variants = false;

    const auto res = bench::DataGenerator(repo).generate_from_skill(o, "ds1");
    ASSERT_EQ(res.cases.size(), 3u);
    EXPECT_EQ(res.cases[0].input_text, "PVC-U管 DN50 PN1.0");
    EXPECT_EQ(res.cases[0].difficulty, bench::Difficulty::Easy);
}

TEST_F(GeneratorTest, UnknownIdsThrow) {
    bench::DataGenerator gen(repo);
    bench::GenerationOptions o = options(5);
    o.skill_id = "SKILL_NOPE";
    EXPECT_THROW(gen.generate_from_skill(o, "ds1"), common::NotFoundError);
    EXPECT_THROW(gen.generate_from_skill(options(5), "missing"), common::NotFoundError);
    EXPECT_THROW(gen.generate_from_template("TPL_NOPE", {}, 5, "ds1"), common::NotFoundError);
}

TEST_F(GeneratorTest, TemplateGeneration) {
    bench::GenerationTemplate t;
    t.id = "TPL_PIPE";
    t.pattern = "{材质}给水管 DN{公称直径}";
    repo.put_template(t);

    bench::ValueDomains values = {
        {"材质", {Scalar("PVC-U"), Scalar("UPVC")}},
        {"公称直径", {Scalar(50), Scalar(100)}},
    };
    const auto res = bench::DataGenerator(repo).generate_from_template("TPL_PIPE", values, 10, "ds1",
                                                                       bench::Difficulty::Easy);
    ASSERT_EQ(res.generated_count, 4);
    EXPECT_EQ(res.cases[0].input_text, "PVC-U给水管 DN50");
    EXPECT_EQ(res.cases[0].id.rfind("TPL_", 0), 0u);
    EXPECT_EQ(res.cases[0].source_type, bench::CaseSource::Template);
    EXPECT_TRUE(res.cases[0].expected_attributes[0].second.has_tolerance);
    EXPECT_FALSE(res.cases[0].expected_attributes[0].second.tolerance.has_value());
    EXPECT_EQ(res.stats.at("by_difficulty").at("easy"), 4);
}
