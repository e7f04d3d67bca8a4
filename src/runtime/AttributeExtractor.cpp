#include "runtime/AttributeExtractor.hpp"

#include <optional>
#include <regex>

namespace runtime {

static std::optional<skill::Scalar> match_first(const std::string& text, const skill::AttributeSpec& spec) {
    for (const auto& cp : spec.compiled) {
        std::smatch m;
        if (!std::regex_search(text, m, cp.re)) continue;

        if (cp.re.mark_count() == 0) return skill::Scalar(m.str(0));
        // a group that did not take part yields no value; the default applies
        if (!m[1].matched) return std::nullopt;
        return skill::Scalar(m.str(1));
    }
    return std::nullopt;
}

AttributeSet extract_attributes(const std::string& text, const skill::SkillDsl& dsl) {
    AttributeSet out;

    for (const auto& spec : dsl.attributes) {
        ExtractedAttribute attr;
        std::optional<skill::Scalar> value = match_first(text, spec);

        if (value) {
            attr.confidence = kPatternConfidence;
            attr.source = AttributeSource::Pattern;
        } else if (spec.default_value && !spec.default_value->is_null()) {
            value = *spec.default_value;
            attr.confidence = kDefaultConfidence;
            attr.source = AttributeSource::Default;
        } else {
            continue;
        }

        if (spec.type == skill::AttributeType::Dimension && value->is_text()) {
            value = skill::Scalar::coerce_decimal(value->as_text());
        }

        attr.value = std::move(*value);
        attr.unit = spec.unit.value_or("");
        attr.display_name = spec.label();
        attr.description = spec.description.value_or("");
        out.set(spec.name, std::move(attr));
    }
    return out;
}

}  // namespace runtime
