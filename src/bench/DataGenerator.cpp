#include "bench/DataGenerator.hpp"

#include <algorithm>
#include <map>
#include <random>

#include "bench/ExpressionTemplates.hpp"
#include "common/Clock.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"

using json = common::json;

namespace bench {

json GenerationResult::to_json() const {
    return {{"generated_count", generated_count}, {"stats", stats}};
}

std::vector<std::pair<Difficulty, int>> difficulty_plan(const std::vector<std::pair<std::string, int>>& custom,
                                                        int total) {
    std::vector<std::pair<Difficulty, int>> plan;
    if (custom.empty()) {
        const int easy = static_cast<int>(total * 0.4);
        const int medium = static_cast<int>(total * 0.3);
        const int hard = static_cast<int>(total * 0.2);
        plan = {
            {Difficulty::Easy, easy},
            {Difficulty::Medium, medium},
            {Difficulty::Hard, hard},
            {Difficulty::Adversarial, total - easy - medium - hard},
        };
        return plan;
    }

    int remaining = total;
    for (const auto& [name, pct] : custom) {
        auto d = parse_difficulty(name);
        if (!d) {
            logging::warn("DataGenerator", "ignoring unknown difficulty: " + name);
            continue;
        }
        const int n = static_cast<int>(static_cast<long long>(total) * pct / 100);
        plan.emplace_back(*d, n);
        remaining -= n;
    }
    if (remaining > 0 && !plan.empty()) plan.front().second += remaining;
    return plan;
}

std::string expected_unit(const std::string& attr, const skill::SkillDsl& dsl) {
    if (const auto* spec = dsl.find_attribute(attr)) return spec->unit.value_or("");

    static const std::map<std::string, std::string> common_units = {
        {"公称直径", "mm"},
        {"公称外径", "mm"},
        {"公称压力", "MPa"},
        {"壁厚", "mm"},
        {"最小壁厚", "mm"},
        {"长度", "mm"},
    };
    auto it = common_units.find(attr);
    return it != common_units.end() ? it->second : "";
}

std::optional<double> expected_tolerance(const std::string& attr, const runtime::AttributeNames& names) {
    if (attr == names.diameter || attr == names.outer_diameter || attr == names.wall_thickness ||
        attr == names.pressure || attr == "壁厚" || attr == "长度") {
        return 0.05;
    }
    return std::nullopt;
}

static json stats_skeleton(size_t combinations) {
    json by_difficulty = json::object();
    for (Difficulty d : all_difficulties()) by_difficulty[to_string(d)] = 0;
    json by_source = json::object();
    for (CaseSource s : {CaseSource::Seed, CaseSource::TableEnum, CaseSource::Template, CaseSource::Noise}) {
        by_source[to_string(s)] = 0;
    }
    return {
        {"by_difficulty", std::move(by_difficulty)},
        {"by_source", std::move(by_source)},
        {"total_combinations", combinations}
    };
}

static void bump(json& counts, const char* key) {
    counts[key] = counts.value(key, 0) + 1;
}

DataGenerator::DataGenerator(store::SkillRepository& repo)
    : m_repo(repo), m_code_rng(std::random_device{}()) {}

std::string DataGenerator::case_code(const char* prefix) {
    return std::string(prefix) + "_" + common::format_utc(common::Clock::now(), "%Y%m%d") + "_" +
           random_hex(m_code_rng, 8);
}

GenerationResult DataGenerator::generate_from_skill(const GenerationOptions& options, const std::string& dataset_id) {
    std::optional<skill::Skill> s = m_repo.get_skill(options.skill_id);
    if (!s) throw common::NotFoundError("skill", options.skill_id);
    if (!m_repo.load_dataset(dataset_id)) throw common::NotFoundError("dataset", dataset_id);
    const skill::SkillDsl& dsl = *s->dsl;

    Rng rng(options.seed);
    const size_t limit = static_cast<size_t>(std::max(options.count, 0)) * 2;

    ValueDomainExtractor extractor(dsl, m_names);
    std::vector<ValueCombination> combos = extractor.cross_table_combinations(limit);
    if (combos.empty()) combos = combinations_from_domains(extractor.extract_all_domains(), limit, rng);

    GenerationResult res;
    res.stats = stats_skeleton(combos.size());
    if (combos.empty()) {
        logging::warn("DataGenerator", "skill " + s->skill_id + " has no tables or value domains; nothing generated");
        return res;
    }

    const std::string domain = dsl.domain.value_or(s->domain);
    ExpressionTemplateEngine templates(domain, options.include_variants);
    NoiseInjector noise;

    std::optional<skill::Scalar> default_material;
    if (const auto* m = dsl.find_attribute(m_names.material)) default_material = m->default_value;

    // same wire keys as the skill's categoryMapping
    const json expected_category = dsl.category ? skill::skill_dsl_to_json(dsl).value("categoryMapping", json(nullptr))
                                                : json(nullptr);

    size_t next = 0;
    for (const auto& [difficulty, n] : difficulty_plan(options.difficulty_distribution, options.count)) {
        for (int i = 0; i < n && static_cast<int>(res.cases.size()) < options.count; ++i) {
            const ValueCombination& combo = combos[next++ % combos.size()];

            ValueCombination render_values = combo;
            if (!render_values.contains(m_names.material) && default_material && !default_material->is_null()) {
                render_values.set(m_names.material, *default_material);
            }
            if (!render_values.contains("name")) render_values.set("name", skill::Scalar(s->skill_name));

            std::string text = templates.generate(render_values, difficulty, rng);
            if (options.include_noise) text = noise.inject(text, difficulty, rng);

            Case c;
            c.id = case_code("GEN");
            c.dataset_id = dataset_id;
            c.input_text = std::move(text);
            c.expected_skill_id = s->skill_id;
            for (const auto& [name, value] : combo.values) {
                if (!name.empty() && name[0] == '_') continue;
                ExpectedAttribute e;
                e.value = value;
                e.unit = expected_unit(name, dsl);
                e.has_tolerance = true;
                e.tolerance = value.is_number() ? expected_tolerance(name, m_names) : std::nullopt;
                c.expected_attributes.emplace_back(name, std::move(e));
            }
            c.expected_category = expected_category;
            c.difficulty = difficulty;
            c.source_type = CaseSource::TableEnum;
            c.source_reference = combo.source;

            bump(res.stats["by_difficulty"], to_string(difficulty));
            bump(res.stats["by_source"], to_string(CaseSource::TableEnum));
            res.cases.push_back(std::move(c));
        }
        if (static_cast<int>(res.cases.size()) >= options.count) break;
    }

    m_repo.append_cases(res.cases);
    merge_dataset_stats(dataset_id, res.cases);
    res.generated_count = static_cast<int>(res.cases.size());
    logging::info("DataGenerator", "generated " + std::to_string(res.generated_count) + " case(s) from skill " +
                                       s->skill_id + " into dataset " + dataset_id);
    return res;
}

GenerationResult DataGenerator::generate_from_template(const std::string& template_id, const ValueDomains& values,
                                                       int count, const std::string& dataset_id, Difficulty difficulty,
                                                       unsigned seed) {
    std::optional<GenerationTemplate> tmpl = m_repo.get_template(template_id);
    if (!tmpl) throw common::NotFoundError("template", template_id);
    if (!m_repo.load_dataset(dataset_id)) throw common::NotFoundError("dataset", dataset_id);

    Rng rng(seed);
    NoiseInjector noise(tmpl->noise_rules);
    std::vector<ValueCombination> combos =
        combinations_from_domains(values, static_cast<size_t>(std::max(count, 0)), rng);

    GenerationResult res;
    for (const auto& combo : combos) {
        std::string text = ExpressionTemplateEngine::render(tmpl->pattern, combo);
        if (!tmpl->variants.empty() && chance(rng, 0.3)) {
            text = ExpressionTemplateEngine::render(pick(rng, tmpl->variants), combo);
        }
        text = noise.inject(text, difficulty, rng);

        Case c;
        c.id = case_code("TPL");
        c.dataset_id = dataset_id;
        c.input_text = std::move(text);
        for (const auto& [name, value] : combo.values) {
            ExpectedAttribute e;
            e.value = value;
            e.has_tolerance = true;  // exact values only
            c.expected_attributes.emplace_back(name, std::move(e));
        }
        c.difficulty = difficulty;
        c.source_type = CaseSource::Template;
        c.source_reference = {{"template_id", template_id}};
        res.cases.push_back(std::move(c));
    }

    m_repo.append_cases(res.cases);
    merge_dataset_stats(dataset_id, res.cases);

    res.generated_count = static_cast<int>(res.cases.size());
    res.stats = {
        {"by_difficulty", {{to_string(difficulty), res.generated_count}}},
        {"by_source", {{to_string(CaseSource::Template), res.generated_count}}}
    };
    return res;
}

void DataGenerator::merge_dataset_stats(const std::string& dataset_id, const std::vector<Case>& cases) {
    std::optional<Dataset> ds = m_repo.load_dataset(dataset_id);
    if (!ds) throw common::NotFoundError("dataset", dataset_id);

    for (const auto& c : cases) {
        const std::string key = to_string(c.difficulty);
        bool found = false;
        for (auto& [d, n] : ds->difficulty_distribution) {
            if (d == key) {
                ++n;
                found = true;
                break;
            }
        }
        if (!found) ds->difficulty_distribution.emplace_back(key, 1);
    }

    int total = 0;
    for (const auto& [d, n] : ds->difficulty_distribution) total += n;
    ds->total_cases = total;
    m_repo.update_dataset(*ds);
}

}  // namespace bench
