#pragma once

#include <string>
#include <utility>
#include <vector>

#include "bench/Models.hpp"
#include "bench/Random.hpp"
#include "bench/ValueDomain.hpp"
#include "common/Json.hpp"

namespace bench {

// Renders a value combination into a material description and roughens it
// according to the difficulty level.
class ExpressionTemplateEngine {
public:
    // `include_variants`: pick among the domain's templates by difficulty;
    // otherwise always use the first (canonical) template.
    explicit ExpressionTemplateEngine(const std::string& domain, bool include_variants = true);

    std::string generate(const ValueCombination& attrs, Difficulty difficulty, Rng& rng) const;

    const std::vector<std::string>& templates() const { return m_templates; }

    // "{name}" placeholders -> values; leftover placeholders are dropped and
    // whitespace is collapsed
    static std::string render(const std::string& tmpl, const ValueCombination& attrs);

    // synonyms, lowercasing, unit omission; each tried with probability 0.5
    std::string apply_medium(const std::string& text, Rng& rng) const;
    // medium + word shuffle + an unrelated leading phrase
    std::string apply_hard(const std::string& text, Rng& rng) const;
    // hard + one typo or adjacent-character swap
    std::string apply_adversarial(const std::string& text, Rng& rng) const;

    std::string replace_synonyms(const std::string& text, double prob, Rng& rng) const;

    static const std::vector<std::string>& default_templates(const std::string& domain);
    static const std::vector<std::pair<std::string, std::vector<std::string>>>& synonyms();

private:
    std::vector<std::string> m_templates;
    bool m_include_variants = true;

    const std::string& select_template(Difficulty difficulty, Rng& rng) const;
};

// Surface noise applied after rendering, with a per-difficulty probability.
// Rules (all optional): {"prefixes": [..], "suffixes": [..], "levels": {"medium": 0.5, ..}}
class NoiseInjector {
public:
    explicit NoiseInjector(const common::json& rules = common::json::object());

    std::string inject(const std::string& text, Difficulty difficulty, Rng& rng) const;

    double level(Difficulty difficulty) const;

    std::string add_prefix(const std::string& text, Rng& rng) const;
    std::string add_suffix(const std::string& text, Rng& rng) const;
    static std::string swap_adjacent(const std::string& text, Rng& rng);
    static std::string add_spaces(const std::string& text, Rng& rng);

private:
    std::vector<std::string> m_prefixes;
    std::vector<std::string> m_suffixes;
    common::json m_levels = common::json::object();
};

}  // namespace bench
