#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/Json.hpp"
#include "skill/SkillDsl.hpp"

namespace skill {

enum class SkillStatus {
    Draft,
    Testing,
    Active,
    Deprecated
};

const char* to_string(SkillStatus s);
std::optional<SkillStatus> parse_skill_status(const std::string& s);

// A versioned ruleset. The DSL is shared and immutable once loaded; publishing
// a new payload creates a new version instead of editing this one.
struct Skill {
    std::string skill_id;
    std::string skill_name;
    std::string domain;
    int priority = 100;
    SkillStatus status = SkillStatus::Draft;
    std::string dsl_version = "1.0.0";
    std::shared_ptr<const SkillDsl> dsl;
};

// Record format: {skill_id, skill_name, domain, priority, status, dsl_version, dsl_content}.
// Identity fields missing on the record fall back to the DSL's own skillId/domain/priority.
// Throws common::DslError when the record or its payload is malformed.
Skill skill_from_json(const common::json& j);
common::json skill_to_json(const Skill& s);

// "1.0.0" -> "1.1.0"
std::string next_minor_version(const std::string& version);

}  // namespace skill
