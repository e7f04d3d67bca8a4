#pragma once

#include <string>
#include <utility>
#include <vector>

#include "bench/Models.hpp"
#include "bench/ValueDomain.hpp"
#include "common/Json.hpp"
#include "store/SkillRepository.hpp"

namespace bench {

struct GenerationOptions {
    std::string skill_id;
    int count = 100;
    std::vector<std::pair<std::string, int>> difficulty_distribution;  // percent per level; empty = 40/30/20/10
    bool include_noise = true;
    bool include_variants = true;
    unsigned seed = 42;
};

struct GenerationResult {
    int generated_count = 0;
    common::json stats = common::json::object();
    std::vector<Case> cases;

    common::json to_json() const;  // counts and stats, not the cases
};

// Per-level case counts for `total`. Custom entries are percentages in the
// given order; unknown levels are ignored and the rounding remainder goes to
// the first known level.
std::vector<std::pair<Difficulty, int>> difficulty_plan(const std::vector<std::pair<std::string, int>>& custom,
                                                        int total);

// Expected unit for a generated attribute: the DSL's unit, else a common one.
std::string expected_unit(const std::string& attr, const skill::SkillDsl& dsl);

// 0.05 for numeric dimension-like attributes, none otherwise
std::optional<double> expected_tolerance(const std::string& attr, const runtime::AttributeNames& names);

class DataGenerator {
public:
    explicit DataGenerator(store::SkillRepository& repo);

    // Table enumeration (value-domain product as fallback), templated by the
    // skill's domain and roughened per difficulty. Cases are appended to the
    // dataset and its statistics updated. Throws common::NotFoundError for an
    // unknown skill or dataset.
    GenerationResult generate_from_skill(const GenerationOptions& options, const std::string& dataset_id);

    // Renders a stored template over the product of the supplied value lists.
    GenerationResult generate_from_template(const std::string& template_id, const ValueDomains& values, int count,
                                            const std::string& dataset_id, Difficulty difficulty = Difficulty::Medium,
                                            unsigned seed = 42);

private:
    store::SkillRepository& m_repo;
    runtime::AttributeNames m_names;
    Rng m_code_rng;  // case codes only; never affects case content

    void merge_dataset_stats(const std::string& dataset_id, const std::vector<Case>& cases);
    std::string case_code(const char* prefix);
};

}  // namespace bench
