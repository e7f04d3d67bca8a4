#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Json.hpp"
#include "skill/Scalar.hpp"

namespace runtime {

enum class AttributeSource {
    Pattern,
    Table,
    Rule,
    Default
};

const char* to_string(AttributeSource s);
std::optional<AttributeSource> parse_attribute_source(const std::string& s);

// Fixed per-source confidences. Not learned; only averaged at the result level.
constexpr double kPatternConfidence = 0.9;
constexpr double kTableConfidence = 1.0;
constexpr double kRuleConfidence = 1.0;
constexpr double kDefaultConfidence = 0.5;
constexpr double kNoSkillConfidence = 0.3;
constexpr double kEmptyResultConfidence = 0.5;

// Attribute names the derivation chain and the name synthesis rely on.
struct AttributeNames {
    std::string diameter = "公称直径";
    std::string pressure = "公称压力";
    std::string outer_diameter = "公称外径";
    std::string series = "管系列";
    std::string wall_thickness = "最小壁厚";
    std::string wall_tolerance = "壁厚偏差";
    std::string material = "材质";
};

struct ExtractedAttribute {
    skill::Scalar value;
    double confidence = 0.0;
    AttributeSource source = AttributeSource::Pattern;
    std::string unit;
    std::string display_name;
    std::string description;

    common::json to_json() const;
    static ExtractedAttribute from_json(const common::json& j);
};

// Insertion-ordered name -> attribute map.
class AttributeSet {
public:
    using Entry = std::pair<std::string, ExtractedAttribute>;

    const ExtractedAttribute* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // replaces an existing entry in place, else appends
    void set(const std::string& name, ExtractedAttribute attr);

    // false (and no change) when the name is already present
    bool insert_if_absent(const std::string& name, ExtractedAttribute attr);

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    std::vector<Entry>::const_iterator begin() const { return m_entries.begin(); }
    std::vector<Entry>::const_iterator end() const { return m_entries.end(); }

    common::json to_json() const;
    static AttributeSet from_json(const common::json& j);

private:
    std::vector<Entry> m_entries;
};

struct CategoryInfo {
    std::string primary = "未分类";
    std::string secondary;
    std::string tertiary;
    std::string quaternary;
    std::string category_id;
    std::string common_name;

    common::json to_json() const;
    static CategoryInfo from_json(const common::json& j);
};

struct MaterialResult {
    std::string material_name;
    std::string common_name;
    CategoryInfo category;
    AttributeSet attributes;
    std::optional<std::string> standard_code;
    double confidence_score = 0.0;
    bool human_review_required = false;

    common::json to_json() const;
    static MaterialResult from_json(const common::json& j);
};

}  // namespace runtime
