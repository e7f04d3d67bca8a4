#include "skill/Skill.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

#include "common/Errors.hpp"
#include "common/TextUtil.hpp"

using json = common::json;

namespace skill {

const char* to_string(SkillStatus s) {
    switch (s) {
        case SkillStatus::Draft: return "draft";
        case SkillStatus::Testing: return "testing";
        case SkillStatus::Active: return "active";
        case SkillStatus::Deprecated: return "deprecated";
        default: return "unknown";
    }
}

std::optional<SkillStatus> parse_skill_status(const std::string& s) {
    const std::string k = textutil::to_lower_ascii(s);
    if (k == "draft") return SkillStatus::Draft;
    if (k == "testing") return SkillStatus::Testing;
    if (k == "active") return SkillStatus::Active;
    if (k == "deprecated") return SkillStatus::Deprecated;
    return std::nullopt;
}

static std::string string_or(const json& j, const char* key, const std::string& def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_string()) throw common::DslError(std::string("record.") + key + " must be a string");
    return j.at(key).get<std::string>();
}

Skill skill_from_json(const json& j) {
    if (!j.is_object()) throw common::DslError("skill record must be an object");
    if (!j.contains("dsl_content")) throw common::DslError("skill record missing required field: dsl_content");

    Skill s;
    auto dsl = std::make_shared<SkillDsl>(parse_skill_dsl(j.at("dsl_content")));

    s.skill_id = string_or(j, "skill_id", dsl->skill_id.value_or(""));
    if (s.skill_id.empty()) throw common::DslError("skill record has no skill_id");

    s.skill_name = string_or(j, "skill_name", dsl->skill_name.value_or(s.skill_id));
    s.domain = string_or(j, "domain", dsl->domain.value_or("general"));

    if (j.contains("priority")) {
        if (!j.at("priority").is_number_integer()) throw common::DslError("record.priority must be an integer");
        s.priority = j.at("priority").get<int>();
    } else {
        s.priority = dsl->priority.value_or(100);
    }

    const std::string status = string_or(j, "status", "draft");
    auto st = parse_skill_status(status);
    if (!st) throw common::DslError("record.status has unknown value: " + status);
    s.status = *st;

    s.dsl_version = string_or(j, "dsl_version", dsl->version.value_or("1.0.0"));
    s.dsl = std::move(dsl);
    return s;
}

json skill_to_json(const Skill& s) {
    json j = json::object();
    j["skill_id"] = s.skill_id;
    j["skill_name"] = s.skill_name;
    j["domain"] = s.domain;
    j["priority"] = s.priority;
    j["status"] = to_string(s.status);
    j["dsl_version"] = s.dsl_version;
    j["dsl_content"] = s.dsl ? skill_dsl_to_json(*s.dsl) : json::object();
    return j;
}

std::string next_minor_version(const std::string& version) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : version) {
        if (c == '.') {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(cur);

    const std::string major = parts[0].empty() ? "1" : parts[0];
    const long minor = parts.size() > 1 ? std::strtol(parts[1].c_str(), nullptr, 10) : 0;

    std::ostringstream oss;
    oss << major << "." << (minor + 1) << ".0";
    return oss.str();
}

}  // namespace skill
