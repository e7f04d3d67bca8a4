#include <gtest/gtest.h>

#include <fstream>
#include <regex>
#include <string>

#include "TestFixtures.hpp"
#include "common/Errors.hpp"
#include "skill/Scalar.hpp"
#include "skill/Skill.hpp"
#include "skill/SkillDsl.hpp"

using common::json;
using skill::Scalar;

TEST(Scalar, IntegersAndRealsCompareNumerically) {
    EXPECT_EQ(Scalar(100), Scalar(100.0));
    EXPECT_NE(Scalar(100), Scalar("100"));
    EXPECT_NE(Scalar(), Scalar(0));
    EXPECT_EQ(Scalar(), Scalar());
}

TEST(Scalar, BooleansStayBooleans) {
    const Scalar t = Scalar::from_json(json(true));
    EXPECT_TRUE(t.is_boolean());
    EXPECT_TRUE(t.as_boolean());
    EXPECT_EQ(t.to_json(), json(true));
    EXPECT_EQ(t.to_string(), "true");
    EXPECT_NE(t, Scalar(1));
    EXPECT_EQ(t, Scalar(true));
    EXPECT_FALSE(t.numeric_value().has_value());
}

TEST(Scalar, ToStringKeepsRealsDistinct) {
    EXPECT_EQ(Scalar(100).to_string(), "100");
    EXPECT_EQ(Scalar(1.6).to_string(), "1.6");
    EXPECT_EQ(Scalar(110.0).to_string(), "110.0");
    EXPECT_EQ(Scalar().to_string(), "null");
}

TEST(Scalar, NumericValueParsesText) {
    EXPECT_DOUBLE_EQ(*Scalar("5.3").numeric_value(), 5.3);
    EXPECT_FALSE(Scalar("S12.5").numeric_value().has_value());
    EXPECT_FALSE(Scalar().numeric_value().has_value());
}

TEST(Scalar, CoerceDecimal) {
    EXPECT_TRUE(Scalar::coerce_decimal("100").is_integer());
    EXPECT_TRUE(Scalar::coerce_decimal("1.6").is_real());
    EXPECT_TRUE(Scalar::coerce_decimal("1.2.3").is_text());
}

TEST(Scalar, FromJsonRejectsContainers) {
    EXPECT_THROW(Scalar::from_json(json::array()), std::runtime_error);
    EXPECT_EQ(Scalar::from_json(json("PE")), Scalar("PE"));
}

TEST(SkillDsl, ParsesPipeSkill) {
    const skill::SkillDsl dsl = skill::parse_skill_dsl(testfx::pipe_dsl_json());

    ASSERT_EQ(dsl.attributes.size(), 3u);
    EXPECT_EQ(dsl.attributes[0].name, "公称直径");
    EXPECT_EQ(dsl.attributes[0].type, skill::AttributeType::Dimension);
    EXPECT_TRUE(dsl.attributes[0].is_required());
    EXPECT_EQ(dsl.attributes[0].compiled.size(), 2u);

    ASSERT_EQ(dsl.tables.size(), 4u);
    EXPECT_EQ(dsl.tables[0].name, "dn_outer_diameter_map");
    const skill::LookupTable* dim = dsl.find_table("dimension_table");
    ASSERT_NE(dim, nullptr);
    EXPECT_EQ(dim->column_containing("S12.5").value_or(99), 2u);
    EXPECT_TRUE(dim->rows[0][1].is_null());

    ASSERT_EQ(dsl.rules.size(), 1u);
    EXPECT_EQ(dsl.rules[0].source_attribute, "材质");
    EXPECT_EQ(dsl.rules[0].target(), "材质描述");

    ASSERT_TRUE(dsl.category.has_value());
    EXPECT_EQ(dsl.category->primary.value_or(""), "管材");
}

TEST(SkillDsl, MissingAttributeTypeIsRejectedWithPath) {
    json j = testfx::pipe_dsl_json();
    j["attributeExtraction"]["公称直径"].erase("type");
    try {
        skill::parse_skill_dsl(j);
        FAIL() << "expected DslError";
    } catch (const common::DslError& e) {
        EXPECT_NE(std::string(e.what()).find("root.attributeExtraction.公称直径"), std::string::npos);
    }
}

TEST(SkillDsl, RowWiderThanColumnsIsRejected) {
    json j = testfx::pipe_dsl_json();
    j["tables"]["series_mapping"]["data"].push_back(json::array({2.0, "S6.3", 2.0}));
    EXPECT_THROW(skill::parse_skill_dsl(j), common::DslError);
}

TEST(SkillDsl, BadPatternIsDroppedNotFatal) {
    json j = testfx::pipe_dsl_json();
    j["attributeExtraction"]["公称压力"]["patterns"] = json::array({"PN([", "PN\\s*([\\d.]+)"});
    const skill::SkillDsl dsl = skill::parse_skill_dsl(j);
    const skill::AttributeSpec* a = dsl.find_attribute("公称压力");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->patterns.size(), 2u);
    ASSERT_EQ(a->compiled.size(), 1u);
    EXPECT_EQ(a->compiled[0].source, "PN\\s*([\\d.]+)");
}

TEST(SkillDsl, RoundTripKeepsOrderAndUnknownKeys) {
    json j = testfx::pipe_dsl_json();
    j["outputStructure"] = {{"format", "flat"}};
    j["tables"]["series_mapping"]["source"] = "表2";
    j["categoryMapping"]["industry"] = "给排水";
    const json out = skill::skill_dsl_to_json(skill::parse_skill_dsl(j));

    EXPECT_EQ(out, j);
    EXPECT_EQ(out.dump(), j.dump());
}

TEST(SkillDsl, ShippedSkillsRoundTripExactly) {
    for (const char* file : {"SKILL_PIPE_PVCU_001@1.0.0.json", "SKILL_FASTENER_BOLT_001@1.0.0.json"}) {
        std::ifstream in(std::string(GBSKILL_DATA_DIR) + "/repo/skills/" + file);
        ASSERT_TRUE(in.good()) << file;
        const json dsl = json::parse(in).at("dsl_content");

        const json out = skill::skill_dsl_to_json(skill::parse_skill_dsl(dsl));
        EXPECT_EQ(out.dump(), dsl.dump()) << file;
    }
}

TEST(SkillDsl, RoundTripKeepsKeyOrderAndOptionalShapes) {
    const json j = json::parse(R"json({
      "skillId": "SKILL_ORDER",
      "domain": "pipe",
      "priority": 5,
      "applicableMaterialTypes": ["管材"],
      "intentRecognition": {"keywords": ["管"]},
      "attributeExtraction": {
        "带胶圈": {"type": "specification", "defaultValue": true, "allowedValues": []},
        "长度": {"unit": "m", "type": "dimension", "patterns": []}
      },
      "tables": {"t": {"columns": ["a", "b"], "rows": [[1, false]]}},
      "rules": {"材质": {"mapping": {"PE": "聚乙烯"}, "targetAttribute": "材质名称"}},
      "fallbackStrategy": {"humanReviewRequired": true}
    })json");

    const skill::SkillDsl dsl = skill::parse_skill_dsl(j);
    const skill::AttributeSpec* ring = dsl.find_attribute("带胶圈");
    ASSERT_NE(ring, nullptr);
    ASSERT_TRUE(ring->default_value.has_value());
    EXPECT_TRUE(ring->default_value->is_boolean());
    EXPECT_DOUBLE_EQ(dsl.fallback->threshold(), 0.6);

    const json out = skill::skill_dsl_to_json(dsl);
    EXPECT_EQ(out.dump(), j.dump());
    EXPECT_FALSE(out.at("intentRecognition").contains("patterns"));
    EXPECT_FALSE(out.at("fallbackStrategy").contains("lowConfidenceThreshold"));
}

TEST(SkillDsl, RewritesMultibyteBracketClasses) {
    EXPECT_EQ(skill::rewrite_multibyte_classes("M\\d+[×xX]\\d+"), "M\\d+(?:[xX]|×)\\d+");
    EXPECT_EQ(skill::rewrite_multibyte_classes("[0-9]+"), "[0-9]+");
    EXPECT_EQ(skill::rewrite_multibyte_classes("[^×]"), "[^×]");

    auto cp = skill::compile_pattern("(M\\d+\\s*[×xX]\\s*\\d+)", "test");
    ASSERT_TRUE(cp.has_value());
    std::smatch m;
    const std::string text = "六角螺栓 M12×50";
    ASSERT_TRUE(std::regex_search(text, m, cp->re));
    EXPECT_EQ(m.str(1), "M12×50");
}

TEST(Skill, RecordFallsBackToDslIdentity) {
    json rec = {{"dsl_content", testfx::pipe_dsl_json()}, {"status", "active"}};
    const skill::Skill s = skill::skill_from_json(rec);
    EXPECT_EQ(s.skill_id, "SKILL_PIPE_TEST");
    EXPECT_EQ(s.domain, "pipe");
    EXPECT_EQ(s.status, skill::SkillStatus::Active);
    EXPECT_EQ(s.dsl_version, "1.0.0");

    rec["status"] = "retired";
    EXPECT_THROW(skill::skill_from_json(rec), common::DslError);
}

TEST(Skill, NextMinorVersion) {
    EXPECT_EQ(skill::next_minor_version("1.0.0"), "1.1.0");
    EXPECT_EQ(skill::next_minor_version("2.9.3"), "2.10.0");
}
