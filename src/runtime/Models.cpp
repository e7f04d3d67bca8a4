#include "runtime/Models.hpp"

#include <stdexcept>

using json = common::json;

namespace runtime {

const char* to_string(AttributeSource s) {
    switch (s) {
        case AttributeSource::Pattern: return "pattern";
        case AttributeSource::Table: return "table";
        case AttributeSource::Rule: return "rule";
        case AttributeSource::Default: return "default";
        default: return "unknown";
    }
}

std::optional<AttributeSource> parse_attribute_source(const std::string& s) {
    if (s == "pattern" || s == "regex") return AttributeSource::Pattern;
    if (s == "table") return AttributeSource::Table;
    if (s == "rule") return AttributeSource::Rule;
    if (s == "default") return AttributeSource::Default;
    return std::nullopt;
}

json ExtractedAttribute::to_json() const {
    return {
        {"value", value.to_json()},
        {"confidence", confidence},
        {"source", to_string(source)},
        {"unit", unit},
        {"displayName", display_name},
        {"description", description}
    };
}

ExtractedAttribute ExtractedAttribute::from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("attribute must be an object");

    ExtractedAttribute a;
    a.value = j.contains("value") ? skill::Scalar::from_json(j.at("value")) : skill::Scalar();
    a.confidence = j.value("confidence", 0.0);
    auto src = parse_attribute_source(j.value("source", "pattern"));
    if (!src) throw std::runtime_error("attribute has unknown source: " + j.value("source", ""));
    a.source = *src;
    a.unit = j.value("unit", "");
    a.display_name = j.value("displayName", "");
    a.description = j.value("description", "");
    return a;
}

const ExtractedAttribute* AttributeSet::find(const std::string& name) const {
    for (const auto& e : m_entries) {
        if (e.first == name) return &e.second;
    }
    return nullptr;
}

void AttributeSet::set(const std::string& name, ExtractedAttribute attr) {
    for (auto& e : m_entries) {
        if (e.first == name) {
            e.second = std::move(attr);
            return;
        }
    }
    m_entries.emplace_back(name, std::move(attr));
}

bool AttributeSet::insert_if_absent(const std::string& name, ExtractedAttribute attr) {
    if (contains(name)) return false;
    m_entries.emplace_back(name, std::move(attr));
    return true;
}

json AttributeSet::to_json() const {
    json j = json::object();
    for (const auto& [name, attr] : m_entries) j[name] = attr.to_json();
    return j;
}

AttributeSet AttributeSet::from_json(const json& j) {
    AttributeSet out;
    if (j.is_null()) return out;
    if (!j.is_object()) throw std::runtime_error("attributes must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        out.m_entries.emplace_back(it.key(), ExtractedAttribute::from_json(it.value()));
    }
    return out;
}

json CategoryInfo::to_json() const {
    return {
        {"primaryCategory", primary},
        {"secondaryCategory", secondary},
        {"tertiaryCategory", tertiary},
        {"quaternaryCategory", quaternary},
        {"categoryId", category_id},
        {"commonName", common_name}
    };
}

CategoryInfo CategoryInfo::from_json(const json& j) {
    CategoryInfo c;
    if (!j.is_object()) return c;
    c.primary = j.value("primaryCategory", c.primary);
    c.secondary = j.value("secondaryCategory", "");
    c.tertiary = j.value("tertiaryCategory", "");
    c.quaternary = j.value("quaternaryCategory", "");
    c.category_id = j.value("categoryId", "");
    c.common_name = j.value("commonName", "");
    return c;
}

json MaterialResult::to_json() const {
    json j = json::object();
    j["material_name"] = material_name;
    j["common_name"] = common_name;
    j["category"] = category.to_json();
    j["attributes"] = attributes.to_json();
    j["standard_code"] = standard_code ? json(*standard_code) : json(nullptr);
    j["confidence_score"] = confidence_score;
    j["human_review_required"] = human_review_required;
    return j;
}

MaterialResult MaterialResult::from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("result must be an object");

    MaterialResult r;
    r.material_name = j.value("material_name", "");
    r.common_name = j.value("common_name", "");
    if (j.contains("category")) r.category = CategoryInfo::from_json(j.at("category"));
    if (j.contains("attributes")) r.attributes = AttributeSet::from_json(j.at("attributes"));
    if (j.contains("standard_code") && j.at("standard_code").is_string()) {
        r.standard_code = j.at("standard_code").get<std::string>();
    }
    r.confidence_score = j.value("confidence_score", 0.0);
    r.human_review_required = j.value("human_review_required", false);
    return r;
}

}  // namespace runtime
