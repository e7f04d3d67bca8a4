#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bench/Random.hpp"
#include "common/Json.hpp"
#include "runtime/Models.hpp"
#include "skill/SkillDsl.hpp"

namespace bench {

// One set of attribute values a case is generated from, plus where it came from.
struct ValueCombination {
    std::vector<std::pair<std::string, skill::Scalar>> values;
    common::json source = common::json::object();

    const skill::Scalar* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    void set(const std::string& name, skill::Scalar v);
};

// attribute -> candidate values, first-seen order, no duplicates
using ValueDomains = std::vector<std::pair<std::string, std::vector<skill::Scalar>>>;

class ValueDomainExtractor {
public:
    explicit ValueDomainExtractor(const skill::SkillDsl& dsl, runtime::AttributeNames names = runtime::AttributeNames{});

    // Table columns (by normalized name) merged with allowedValues / "enum"
    // lists; an attribute with neither falls back to its defaultValue.
    ValueDomains extract_all_domains() const;

    // one combination per row of the named table
    std::vector<ValueCombination> table_combinations(const std::string& table_name) const;

    // One combination per (dimension_table row, thickness column). The pressure
    // comes from the column header ("...PN1.0..."), the diameter from a
    // reverse lookup in the DN -> OD table. Empty when the skill has no
    // dimension_table.
    std::vector<ValueCombination> cross_table_combinations(size_t limit) const;

    // column header -> attribute name; nullopt for an empty header
    std::optional<std::string> normalize_column(const std::string& column) const;

private:
    const skill::SkillDsl& m_dsl;
    runtime::AttributeNames m_names;
};

// Cartesian product of the domains; more than `limit` results are sampled
// down to `limit` distinct combinations.
std::vector<ValueCombination> combinations_from_domains(const ValueDomains& domains, size_t limit, Rng& rng);

}  // namespace bench
