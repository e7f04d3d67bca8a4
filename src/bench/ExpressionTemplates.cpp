#include "bench/ExpressionTemplates.hpp"

#include <algorithm>
#include <map>
#include <regex>

#include "common/TextUtil.hpp"

using json = common::json;

namespace bench {

const std::vector<std::string>& ExpressionTemplateEngine::default_templates(const std::string& domain) {
    static const std::map<std::string, std::vector<std::string>> by_domain = {
        {"pipe", {
            "{材质}管 DN{公称直径} PN{公称压力}",
            "{材质}管材 DN{公称直径}mm PN{公称压力}MPa",
            "DN{公称直径} PN{公称压力} {材质}管",
            "{材质}管 DN{公称直径}",
            "DN{公称直径}管 {材质}",
            "{材质}管道 直径{公称直径} 压力{公称压力}",
            "管材规格: DN{公称直径}, PN{公称压力}",
        }},
        {"fastener", {
            "{头型}螺栓 {规格} {材质} {表面处理}",
            "{材质}{头型}螺栓{规格}",
            "螺栓 {规格} {材质}",
            "{规格}螺栓",
            "{头型}螺丝 {规格}",
        }},
        {"default", {
            "{name} {规格}",
            "{材质} {name}",
        }},
    };
    auto it = by_domain.find(domain);
    return it != by_domain.end() ? it->second : by_domain.at("default");
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& ExpressionTemplateEngine::synonyms() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"管", {"管材", "管道", "管子"}},
        {"螺栓", {"螺丝", "螺柱", "bolt"}},
        {"六角头", {"六角", "外六角", "Hex"}},
        {"PVC-U", {"UPVC", "PVC", "硬PVC", "聚氯乙烯"}},
        {"PPR", {"PP-R", "无规共聚聚丙烯"}},
        {"不锈钢", {"304不锈钢", "316不锈钢", "不锈钢材质"}},
    };
    return table;
}

static const std::vector<std::pair<std::string, std::string>>& typo_map() {
    static const std::vector<std::pair<std::string, std::string>> typos = {
        {"管材", "管才"},
        {"螺栓", "螺拴"},
        {"直径", "直经"},
        {"压力", "压励"},
    };
    return typos;
}

ExpressionTemplateEngine::ExpressionTemplateEngine(const std::string& domain, bool include_variants)
    : m_templates(default_templates(domain)), m_include_variants(include_variants) {}

const std::string& ExpressionTemplateEngine::select_template(Difficulty difficulty, Rng& rng) const {
    if (!m_include_variants) return m_templates.front();
    switch (difficulty) {
        case Difficulty::Easy:
            return m_templates.front();
        case Difficulty::Medium:
            return m_templates[std::min(m_templates.size() / 2, m_templates.size() - 1)];
        default:
            return pick(rng, m_templates);
    }
}

std::string ExpressionTemplateEngine::render(const std::string& tmpl, const ValueCombination& attrs) {
    std::string out = tmpl;
    for (const auto& [name, value] : attrs.values) {
        if (!name.empty() && name[0] == '_') continue;
        textutil::replace_all(out, "{" + name + "}", value.to_string());
    }

    static const std::regex leftover(R"(\{[^}]+\})");
    out = std::regex_replace(out, leftover, "");
    return textutil::collapse_spaces(out);
}

std::string ExpressionTemplateEngine::replace_synonyms(const std::string& text, double prob, Rng& rng) const {
    std::string out = text;
    for (const auto& [word, alternatives] : synonyms()) {
        if (out.find(word) != std::string::npos && chance(rng, prob)) {
            textutil::replace_first(out, word, pick(rng, alternatives));
        }
    }
    return out;
}

std::string ExpressionTemplateEngine::apply_medium(const std::string& text, Rng& rng) const {
    static const std::regex units(R"((mm|MPa|cm|m)\b)");

    std::string out = text;
    if (chance(rng, 0.5)) out = replace_synonyms(out, 0.3, rng);
    if (chance(rng, 0.5) && chance(rng, 0.3)) out = textutil::to_lower_ascii(out);
    if (chance(rng, 0.5) && chance(rng, 0.5)) out = std::regex_replace(out, units, "");
    return textutil::trim(out);
}

std::string ExpressionTemplateEngine::apply_hard(const std::string& text, Rng& rng) const {
    static const std::vector<std::string> filler = {"一批", "急需", "现货", "优质", "国标"};

    std::string out = apply_medium(text, rng);
    if (chance(rng, 0.3)) {
        std::vector<std::string> words = textutil::split_ws(out);
        std::shuffle(words.begin(), words.end(), rng);
        out = textutil::join(words, " ");
    }
    if (chance(rng, 0.3)) out = pick(rng, filler) + " " + out;
    return textutil::trim(out);
}

std::string ExpressionTemplateEngine::apply_adversarial(const std::string& text, Rng& rng) const {
    std::string out = apply_hard(text, rng);

    if (chance(rng, 0.5)) {
        for (const auto& [correct, typo] : typo_map()) {
            if (textutil::replace_first(out, correct, typo)) return textutil::trim(out);
        }
    }
    return textutil::trim(NoiseInjector::swap_adjacent(out, rng));
}

std::string ExpressionTemplateEngine::generate(const ValueCombination& attrs, Difficulty difficulty, Rng& rng) const {
    std::string text = render(select_template(difficulty, rng), attrs);
    switch (difficulty) {
        case Difficulty::Medium: return apply_medium(text, rng);
        case Difficulty::Hard: return apply_hard(text, rng);
        case Difficulty::Adversarial: return apply_adversarial(text, rng);
        default: return text;
    }
}

// ---------- NoiseInjector ----------

static std::vector<std::string> string_list_or(const json& rules, const char* key, std::vector<std::string> fallback) {
    if (!rules.is_object() || !rules.contains(key) || !rules.at(key).is_array()) return fallback;
    std::vector<std::string> out;
    for (const auto& v : rules.at(key)) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out.empty() ? fallback : out;
}

NoiseInjector::NoiseInjector(const json& rules)
    : m_prefixes(string_list_or(rules, "prefixes", {"采购", "询价", "需要", "订购", "紧急采购"})),
      m_suffixes(string_list_or(rules, "suffixes", {"若干", "100根", "一批", "1000个", "等"})) {
    if (rules.is_object() && rules.contains("levels") && rules.at("levels").is_object()) m_levels = rules.at("levels");
}

double NoiseInjector::level(Difficulty difficulty) const {
    const char* key = to_string(difficulty);
    if (m_levels.contains(key) && m_levels.at(key).is_number()) return m_levels.at(key).get<double>();

    switch (difficulty) {
        case Difficulty::Medium: return 0.2;
        case Difficulty::Hard: return 0.4;
        case Difficulty::Adversarial: return 0.6;
        default: return 0.0;
    }
}

std::string NoiseInjector::inject(const std::string& text, Difficulty difficulty, Rng& rng) const {
    if (!chance(rng, level(difficulty))) return text;

    switch (pick_index(rng, 0, 3)) {
        case 0: return add_prefix(text, rng);
        case 1: return add_suffix(text, rng);
        case 2: return swap_adjacent(text, rng);
        default: return add_spaces(text, rng);
    }
}

std::string NoiseInjector::add_prefix(const std::string& text, Rng& rng) const {
    return pick(rng, m_prefixes) + " " + text;
}

std::string NoiseInjector::add_suffix(const std::string& text, Rng& rng) const {
    return text + " " + pick(rng, m_suffixes);
}

std::string NoiseInjector::swap_adjacent(const std::string& text, Rng& rng) {
    std::vector<std::string> chars = textutil::utf8_chars(text);
    if (chars.size() < 4) return text;
    const size_t i = pick_index(rng, 1, chars.size() - 2);
    std::swap(chars[i], chars[i + 1]);
    return textutil::join(chars, "");
}

std::string NoiseInjector::add_spaces(const std::string& text, Rng& rng) {
    std::vector<std::string> words = textutil::split_ws(text);
    if (words.size() < 2) return text;
    words[pick_index(rng, 0, words.size() - 1)] += "  ";
    return textutil::join(words, " ");
}

}  // namespace bench
