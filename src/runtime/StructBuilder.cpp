#include "runtime/StructBuilder.hpp"

#include <cmath>

#include "common/TextUtil.hpp"

namespace runtime {

static double round_to(double v, double scale) {
    return std::round(v * scale) / scale;
}

CategoryInfo map_category(const skill::SkillDsl& dsl) {
    CategoryInfo c;
    if (!dsl.category) return c;
    const auto& m = *dsl.category;
    c.primary = m.primary.value_or(c.primary);
    c.secondary = m.secondary.value_or("");
    c.tertiary = m.tertiary.value_or("");
    c.quaternary = m.quaternary.value_or("");
    c.category_id = m.category_id.value_or("");
    c.common_name = m.common_name.value_or("");
    return c;
}

double aggregate_confidence(const AttributeSet& attrs) {
    if (attrs.empty()) return kEmptyResultConfidence;
    double sum = 0.0;
    for (const auto& [name, a] : attrs) sum += a.confidence;
    return round_to(sum / static_cast<double>(attrs.size()), 1000.0);
}

std::string synthesize_name(const std::string& input, const AttributeSet& attrs, const skill::SkillDsl& dsl,
                            const AttributeNames& names) {
    const ExtractedAttribute* material = attrs.find(names.material);
    const ExtractedAttribute* diameter = attrs.find(names.diameter);
    if (!material && !diameter) return textutil::utf8_prefix(input, 20);

    std::string name;
    if (material) name += material->value.to_string();
    name += dsl.domain.value_or("") == "pipe" ? "管" : "件";
    if (diameter) name += "DN" + diameter->value.to_string();
    return name;
}

MaterialResult build_struct(const std::string& input, AttributeSet attrs, CategoryInfo category,
                            const skill::SkillDsl& dsl, const AttributeNames& names) {
    MaterialResult r;
    r.material_name = synthesize_name(input, attrs, dsl, names);

    r.common_name = category.common_name;
    if (r.common_name.empty()) {
        if (const auto* m = attrs.find(names.material)) r.common_name = "工业用" + m->value.to_string() + "管材";
    }

    r.confidence_score = aggregate_confidence(attrs);
    if (dsl.fallback) {
        r.human_review_required = dsl.fallback->review_required() &&
                                  r.confidence_score < dsl.fallback->threshold();
    }

    r.standard_code = dsl.standard_code;
    r.category = std::move(category);
    r.attributes = std::move(attrs);
    return r;
}

MaterialResult default_result(const std::string& input) {
    MaterialResult r;
    r.material_name = textutil::utf8_prefix(input, 50);
    r.confidence_score = kNoSkillConfidence;
    return r;
}

}  // namespace runtime
