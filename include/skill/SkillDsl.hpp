#pragma once

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "common/Json.hpp"
#include "skill/Scalar.hpp"

namespace skill {

enum class AttributeType {
    Dimension,
    Material,
    Performance,
    Specification,
    Category
};

const char* to_string(AttributeType t);
std::optional<AttributeType> parse_attribute_type(const std::string& s);

// A DSL regex compiled once at load time. `source` is the pattern as written.
struct CompiledPattern {
    std::string source;
    std::regex re;
};

// Every DSL object below keeps `key_order`, the keys as they appeared in the
// source document, so serialization writes them back in the same order.

struct Recognition {
    std::vector<std::string> keywords;
    std::vector<std::string> patterns;
    bool has_keywords = false;
    bool has_patterns = false;
    std::vector<CompiledPattern> compiled;  // scoring only, never used for extraction
    common::json extras = common::json::object();
    std::vector<std::string> key_order;
};

struct AttributeSpec {
    std::string name;
    AttributeType type = AttributeType::Specification;
    std::optional<std::string> unit;
    std::vector<std::string> patterns;      // declared order = precedence order
    bool has_patterns = false;
    std::vector<CompiledPattern> compiled;  // subset of `patterns` that compiled, same order
    std::optional<bool> required;
    std::optional<Scalar> default_value;
    std::vector<Scalar> allowed_values;
    bool has_allowed_values = false;
    std::optional<std::string> display_name;
    std::optional<std::string> description;
    common::json extras = common::json::object();  // keys we do not interpret ("enum", ...)
    std::vector<std::string> key_order;

    bool is_required() const { return required.value_or(false); }
    std::string label() const { return display_name.value_or(name); }
};

struct LookupTable {
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> columns;
    std::vector<std::vector<Scalar>> rows;  // each row aligned with `columns`, may be shorter
    std::string rows_key = "data";          // "data" or the older "rows"
    common::json extras = common::json::object();
    std::vector<std::string> key_order;

    // first column whose header contains `needle`
    std::optional<size_t> column_containing(const std::string& needle) const;

    // first row whose cell at `key_col` equals `key`
    const std::vector<Scalar>* find_row(size_t key_col, const Scalar& key) const;
};

// sourceValue -> derivedValue, fired when the source attribute is present
struct RuleSpec {
    std::string name;
    std::string source_attribute;
    std::optional<std::string> declared_source;  // as written; empty means "rule key is the source"
    std::optional<std::string> target_attribute;
    std::optional<std::string> type;
    std::vector<std::pair<std::string, Scalar>> mapping;
    bool has_mapping = false;
    std::optional<std::string> mapping_table;
    std::optional<std::string> display_name;
    std::optional<std::string> description;
    common::json extras = common::json::object();
    std::vector<std::string> key_order;

    std::string target() const { return target_attribute.value_or(source_attribute + "描述"); }
};

struct CategoryMapping {
    std::optional<std::string> primary;
    std::optional<std::string> secondary;
    std::optional<std::string> tertiary;
    std::optional<std::string> quaternary;
    std::optional<std::string> category_id;
    std::optional<std::string> common_name;
    common::json extras = common::json::object();
    std::vector<std::string> key_order;
};

struct FallbackPolicy {
    std::optional<double> low_confidence_threshold;
    std::optional<bool> human_review_required;
    common::json extras = common::json::object();
    std::vector<std::string> key_order;

    double threshold() const { return low_confidence_threshold.value_or(0.6); }
    bool review_required() const { return human_review_required.value_or(false); }
};

struct SkillDsl {
    std::optional<std::string> skill_id;
    std::optional<std::string> skill_name;
    std::optional<std::string> version;
    std::optional<std::string> standard_code;
    std::optional<std::string> domain;
    std::optional<int> priority;
    std::optional<std::vector<std::string>> applicable_material_types;

    std::optional<Recognition> recognition;
    std::vector<AttributeSpec> attributes;  // ordered
    bool has_attributes = false;
    std::vector<LookupTable> tables;        // ordered
    bool has_tables = false;
    std::vector<RuleSpec> rules;
    bool has_rules = false;
    std::optional<CategoryMapping> category;
    std::optional<FallbackPolicy> fallback;

    // top-level keys we carry but do not interpret (outputStructure, ...)
    common::json extensions = common::json::object();
    std::vector<std::string> key_order;

    const AttributeSpec* find_attribute(const std::string& name) const;
    const LookupTable* find_table(const std::string& name) const;
};

// Validates structure and compiles every regex. Throws common::DslError with a
// dotted path on structural failure. A pattern that fails to compile is dropped
// with a logged warning; that alone never rejects the payload.
SkillDsl parse_skill_dsl(const common::json& j);

// skill_dsl_to_json(parse_skill_dsl(j)) == j, key order included.
common::json skill_dsl_to_json(const SkillDsl& dsl);

// nullopt (and a warning) when the pattern does not compile
std::optional<CompiledPattern> compile_pattern(const std::string& pattern, const std::string& where);

// "[×x]" -> "(?:[x]|×)": the regex engine matches bytes, so a bracket
// expression listing a multi-byte character would match its bytes separately.
std::string rewrite_multibyte_classes(const std::string& pattern);

}  // namespace skill
