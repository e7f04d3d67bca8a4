#include "bench/ValueDomain.hpp"

#include <limits>
#include <regex>
#include <unordered_set>

#include "common/TextUtil.hpp"

using json = common::json;

namespace bench {

std::string random_hex(Rng& rng, size_t n) {
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.push_back(digits[pick_index(rng, 0, 15)]);
    return out;
}

const skill::Scalar* ValueCombination::find(const std::string& name) const {
    for (const auto& [k, v] : values) {
        if (k == name) return &v;
    }
    return nullptr;
}

void ValueCombination::set(const std::string& name, skill::Scalar v) {
    for (auto& [k, existing] : values) {
        if (k == name) {
            existing = std::move(v);
            return;
        }
    }
    values.emplace_back(name, std::move(v));
}

static void add_unique(std::vector<skill::Scalar>& into, const skill::Scalar& v) {
    for (const auto& e : into) {
        if (e == v && e.kind() == v.kind()) return;
    }
    into.push_back(v);
}

static std::vector<skill::Scalar>* domain_for(ValueDomains& domains, const std::string& name) {
    for (auto& [k, vals] : domains) {
        if (k == name) return &vals;
    }
    return nullptr;
}

static bool is_thickness_column(const std::string& column) {
    return column.find("厚") != std::string::npos;
}

ValueDomainExtractor::ValueDomainExtractor(const skill::SkillDsl& dsl, runtime::AttributeNames names)
    : m_dsl(dsl), m_names(std::move(names)) {}

std::optional<std::string> ValueDomainExtractor::normalize_column(const std::string& column) const {
    if (column.empty()) return std::nullopt;

    const std::vector<std::pair<std::string, std::string>> mappings = {
        {"厚", m_names.wall_thickness},
        {"外径", m_names.outer_diameter},
        {"DN", m_names.diameter},
        {"dn", m_names.diameter},
        {"PN", m_names.pressure},
        {"pn", m_names.pressure},
        {"长度", "长度"},
        {"规格", "规格"},
    };
    for (const auto& [key, name] : mappings) {
        if (column == key) return name;
    }
    for (const auto& [key, name] : mappings) {
        if (column.find(key) != std::string::npos) return name;
    }

    // drop unit suffixes such as "(mm)"
    static const std::regex unit_suffix(R"(\([^)]*\))");
    std::string clean = textutil::trim(std::regex_replace(column, unit_suffix, ""));
    if (clean.empty()) return std::nullopt;
    return clean;
}

ValueDomains ValueDomainExtractor::extract_all_domains() const {
    ValueDomains domains;

    for (const auto& table : m_dsl.tables) {
        for (size_t col = 0; col < table.columns.size(); ++col) {
            auto name = normalize_column(table.columns[col]);
            if (!name) continue;

            std::vector<skill::Scalar> values;
            for (const auto& row : table.rows) {
                if (col < row.size() && !row[col].is_null()) add_unique(values, row[col]);
            }
            if (values.empty()) continue;

            if (auto* existing = domain_for(domains, *name)) {
                for (const auto& v : values) add_unique(*existing, v);
            } else {
                domains.emplace_back(*name, std::move(values));
            }
        }
    }

    for (const auto& spec : m_dsl.attributes) {
        std::vector<skill::Scalar> listed = spec.allowed_values;
        if (listed.empty() && spec.extras.contains("enum") && spec.extras.at("enum").is_array()) {
            for (const auto& v : spec.extras.at("enum")) {
                if (v.is_primitive()) listed.push_back(skill::Scalar::from_json(v));
            }
        }

        if (!listed.empty()) {
            if (auto* existing = domain_for(domains, spec.name)) {
                *existing = std::move(listed);
            } else {
                domains.emplace_back(spec.name, std::move(listed));
            }
        } else if (spec.default_value && !spec.default_value->is_null() && !domain_for(domains, spec.name)) {
            domains.emplace_back(spec.name, std::vector<skill::Scalar>{*spec.default_value});
        }
    }
    return domains;
}

std::vector<ValueCombination> ValueDomainExtractor::table_combinations(const std::string& table_name) const {
    std::vector<ValueCombination> out;
    const skill::LookupTable* table = m_dsl.find_table(table_name);
    if (!table) return out;

    for (size_t r = 0; r < table->rows.size(); ++r) {
        const auto& row = table->rows[r];
        ValueCombination combo;
        combo.source = {{"table", table_name}, {"row_index", r}};
        for (size_t col = 0; col < table->columns.size() && col < row.size(); ++col) {
            if (auto name = normalize_column(table->columns[col])) combo.set(*name, row[col]);
        }
        out.push_back(std::move(combo));
    }
    return out;
}

std::vector<ValueCombination> ValueDomainExtractor::cross_table_combinations(size_t limit) const {
    std::vector<ValueCombination> out;
    const skill::LookupTable* dim = m_dsl.find_table("dimension_table");
    if (!dim) return out;
    const skill::LookupTable* od_map = m_dsl.find_table("dn_outer_diameter_map");

    static const std::regex pn_in_header(R"(PN?([\d.]+))");

    std::vector<size_t> thickness_cols;
    for (size_t c = 0; c < dim->columns.size(); ++c) {
        if (is_thickness_column(dim->columns[c])) thickness_cols.push_back(c);
    }

    for (size_t r = 0; r < dim->rows.size() && out.size() < limit; ++r) {
        const auto& row = dim->rows[r];

        ValueCombination base;
        for (size_t c = 0; c < dim->columns.size() && c < row.size(); ++c) {
            if (is_thickness_column(dim->columns[c])) continue;
            if (auto name = normalize_column(dim->columns[c])) base.set(*name, row[c]);
        }

        // the inputs name a DN, so recover it from the OD when the skill maps DN -> OD
        if (od_map && !base.contains(m_names.diameter)) {
            if (const skill::Scalar* od = base.find(m_names.outer_diameter)) {
                if (const auto* dn_row = od_map->find_row(1, *od)) base.set(m_names.diameter, (*dn_row)[0]);
            }
        }

        if (thickness_cols.empty()) {
            base.source = {{"table", dim->name}, {"row_index", r}};
            out.push_back(std::move(base));
            continue;
        }

        for (size_t c : thickness_cols) {
            if (c >= row.size() || row[c].is_null()) continue;
            if (row[c].is_number() && row[c].as_number() == 0.0) continue;

            ValueCombination combo = base;
            combo.set(m_names.wall_thickness, row[c]);
            std::smatch m;
            if (std::regex_search(dim->columns[c], m, pn_in_header)) {
                if (auto pn = skill::Scalar(m.str(1)).numeric_value()) combo.set(m_names.pressure, skill::Scalar(*pn));
            }
            combo.source = {{"table", dim->name}, {"row_index", r}, {"col_index", c}};
            out.push_back(std::move(combo));
        }
    }

    if (out.size() > limit) out.resize(limit);
    return out;
}

static ValueCombination decode(const ValueDomains& domains, unsigned long long index) {
    ValueCombination combo;
    combo.values.resize(domains.size());
    // last attribute varies fastest
    for (size_t i = domains.size(); i-- > 0;) {
        const auto& vals = domains[i].second;
        combo.values[i] = {domains[i].first, vals[index % vals.size()]};
        index /= vals.size();
    }
    return combo;
}

std::vector<ValueCombination> combinations_from_domains(const ValueDomains& domains, size_t limit, Rng& rng) {
    std::vector<ValueCombination> out;
    if (domains.empty() || limit == 0) return out;

    const unsigned long long cap = std::numeric_limits<unsigned long long>::max() / 2;
    unsigned long long total = 1;
    for (const auto& [name, vals] : domains) {
        if (vals.empty()) return out;
        total = total > cap / vals.size() ? cap : total * vals.size();
    }

    if (total <= limit) {
        for (unsigned long long i = 0; i < total; ++i) out.push_back(decode(domains, i));
        return out;
    }

    std::uniform_int_distribution<unsigned long long> dist(0, total - 1);
    std::unordered_set<unsigned long long> seen;
    while (out.size() < limit) {
        const unsigned long long i = dist(rng);
        if (seen.insert(i).second) out.push_back(decode(domains, i));
    }
    return out;
}

}  // namespace bench
