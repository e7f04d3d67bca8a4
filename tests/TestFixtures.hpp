#pragma once

#include <memory>
#include <string>

#include "common/Json.hpp"
#include "skill/Skill.hpp"
#include "skill/SkillDsl.hpp"

namespace testfx {

// Cut-down PVC-U pipe skill: DN/PN extraction, the four-table chain and one
// mapping rule.
inline common::json pipe_dsl_json() {
    return common::json::parse(R"json({
      "skillId": "SKILL_PIPE_TEST",
      "skillName": "PVC-U给水管材",
      "version": "1.0.0",
      "standardCode": "GB/T 10002.1-2023",
      "domain": "pipe",
      "intentRecognition": {
        "keywords": ["PVC", "给水管", "管材"],
        "patterns": ["DN\\d+"]
      },
      "attributeExtraction": {
        "公称直径": {"type": "dimension", "unit": "mm", "patterns": ["DN\\s*(\\d+)", "直径\\s*(\\d+)"], "required": true},
        "公称压力": {"type": "performance", "unit": "MPa", "patterns": ["PN\\s*([\\d.]+)"]},
        "材质": {"type": "material", "patterns": ["(PVC-U|UPVC)"], "defaultValue": "PVC-U"}
      },
      "tables": {
        "dn_outer_diameter_map": {"columns": ["DN", "公称外径"], "data": [[50, 50], [100, 110], [150, 160]]},
        "series_mapping": {"columns": ["公称压力", "管系列"], "data": [[0.6, "S20"], [1.0, "S12.5"], [1.6, "S8"]]},
        "dimension_table": {
          "description": "规格尺寸表",
          "columns": ["公称外径dn", "S20(PN0.6)壁厚", "S12.5(PN1.0)壁厚", "S8(PN1.6)壁厚"],
          "data": [[50, null, 2.4, 3.7], [110, 2.7, 4.2, 6.6], [160, 4.0, 6.2, 9.5]]
        },
        "wall_thickness_tolerance": {
          "columns": ["壁厚范围", "允许偏差"],
          "data": [["2.1-3.0", 0.5], ["3.1-4.0", 0.6], ["4.1-5.0", 0.7], ["6.1-10.0", 1.0]]
        }
      },
      "rules": {
        "材质": {"targetAttribute": "材质描述", "mapping": {"PVC-U": "硬聚氯乙烯", "UPVC": "硬聚氯乙烯"}}
      },
      "categoryMapping": {
        "primaryCategory": "管材",
        "secondaryCategory": "塑料管",
        "categoryId": "CAT_PIPE",
        "commonName": "PVC-U给水管"
      }
    })json");
}

inline common::json bolt_dsl_json() {
    return common::json::parse(R"json({
      "skillId": "SKILL_BOLT_TEST",
      "skillName": "六角头螺栓",
      "domain": "fastener",
      "intentRecognition": {"keywords": ["螺栓", "六角"], "patterns": ["M\\d+"]},
      "attributeExtraction": {
        "规格": {"type": "specification", "patterns": ["(M\\d+\\s*[×xX]\\s*\\d+)", "(M\\d+)"]},
        "材质": {"type": "material", "patterns": ["(304|316|碳钢)"]}
      },
      "categoryMapping": {"primaryCategory": "紧固件", "secondaryCategory": "螺栓"}
    })json");
}

inline skill::Skill make_skill(const common::json& dsl_json, skill::SkillStatus status = skill::SkillStatus::Active,
                               int priority = 100) {
    skill::Skill s;
    auto dsl = std::make_shared<skill::SkillDsl>(skill::parse_skill_dsl(dsl_json));
    s.skill_id = dsl->skill_id.value_or("SKILL_TEST");
    s.skill_name = dsl->skill_name.value_or(s.skill_id);
    s.domain = dsl->domain.value_or("general");
    s.priority = priority;
    s.status = status;
    s.dsl = std::move(dsl);
    return s;
}

}  // namespace testfx
