#include "runtime/RuleEngine.hpp"

#include <optional>

using json = common::json;

namespace runtime {

static std::optional<skill::Scalar> map_value(const skill::RuleSpec& rule, const skill::Scalar& source,
                                              const skill::SkillDsl& dsl) {
    const std::string key = source.to_string();
    for (const auto& [from, to] : rule.mapping) {
        if (from == key) return to;
    }

    if (rule.mapping_table) {
        const skill::LookupTable* table = dsl.find_table(*rule.mapping_table);
        if (!table) return std::nullopt;
        for (const auto& row : table->rows) {
            if (row.size() < 2) continue;
            if (row[0] == source || row[0].to_string() == key) return row[1];
        }
    }
    return std::nullopt;
}

json RuleOutcome::input_json() const {
    return {{"rules_count", rule_count}};
}

json RuleOutcome::output_json() const {
    json arr = json::array();
    for (const auto& a : applied) arr.push_back(a.rule + ":" + a.source_value);
    return {{"applied_rules", std::move(arr)}};
}

RuleOutcome apply_rules(AttributeSet& attrs, const skill::SkillDsl& dsl) {
    RuleOutcome out;
    out.rule_count = dsl.rules.size();

    for (const auto& rule : dsl.rules) {
        const ExtractedAttribute* src = attrs.find(rule.source_attribute);
        if (!src) continue;

        const std::string target = rule.target();
        if (attrs.contains(target)) continue;

        auto mapped = map_value(rule, src->value, dsl);
        if (!mapped) continue;

        const std::string source_value = src->value.to_string();

        ExtractedAttribute a;
        a.value = std::move(*mapped);
        a.confidence = kRuleConfidence;
        a.source = AttributeSource::Rule;
        a.display_name = rule.display_name.value_or(target);
        a.description = rule.description.value_or("由" + rule.source_attribute + "=" + source_value + "推导");
        attrs.insert_if_absent(target, std::move(a));

        out.applied.push_back({rule.name, source_value, target});
    }
    return out;
}

}  // namespace runtime
