#include "runtime/TableEngine.hpp"

#include <cstdlib>

#include "common/TextUtil.hpp"

using json = common::json;

namespace runtime {

// "100" -> 100; anything that does not parse stays as it was
static skill::Scalar coerce_integer(const skill::Scalar& v) {
    if (!v.is_text()) return v;
    const std::string t = textutil::trim(v.as_text());
    if (t.empty()) return v;
    char* end = nullptr;
    long long n = std::strtoll(t.c_str(), &end, 10);
    if (end != t.c_str() + t.size()) return v;
    return skill::Scalar(n);
}

static skill::Scalar coerce_real(const skill::Scalar& v) {
    if (!v.is_text()) return v;
    auto n = v.numeric_value();
    return n ? skill::Scalar(*n) : v;
}

// mirrors the truthiness test of a lookup key: null, 0 and "" never look anything up
static bool usable_key(const skill::Scalar& v) {
    if (v.is_null()) return false;
    if (v.is_number()) return v.as_number() != 0.0;
    return !v.as_text().empty();
}

static const skill::Scalar* cell(const std::vector<skill::Scalar>& row, size_t i) {
    return i < row.size() ? &row[i] : nullptr;
}

static std::string table_label(const skill::LookupTable& t) {
    return t.description.value_or(t.name);
}

static ExtractedAttribute table_attr(skill::Scalar value, std::string unit, std::string display,
                                     std::string description) {
    ExtractedAttribute a;
    a.value = std::move(value);
    a.confidence = kTableConfidence;
    a.source = AttributeSource::Table;
    a.unit = std::move(unit);
    a.display_name = std::move(display);
    a.description = std::move(description);
    return a;
}

json TableDerivation::input_json() const {
    return {
        {"tables_count", table_count},
        {"dn", diameter.to_json()},
        {"pn", pressure.to_json()}
    };
}

json TableDerivation::output_json() const {
    json f = json::object();
    for (const auto& [name, v] : found) f[name] = v.to_json();
    return {{"found_values", std::move(f)}};
}

std::optional<skill::Scalar> lookup_thickness_tolerance(double wall_thickness, const skill::LookupTable& table) {
    for (const auto& row : table.rows) {
        if (row.size() < 2) continue;

        const std::string range = row[0].to_string();
        const size_t dash = range.find('-');
        if (dash == std::string::npos || range.find('-', dash + 1) != std::string::npos) continue;

        auto lo = skill::Scalar(range.substr(0, dash)).numeric_value();
        auto hi = skill::Scalar(range.substr(dash + 1)).numeric_value();
        if (!lo || !hi) continue;

        if (*lo <= wall_thickness && wall_thickness <= *hi) return row[1];
    }
    return std::nullopt;
}

TableDerivation derive_from_tables(AttributeSet& attrs, const skill::SkillDsl& dsl, const TableEngineConfig& cfg) {
    const AttributeNames& n = cfg.names;

    TableDerivation d;
    d.table_count = dsl.tables.size();
    if (const auto* a = attrs.find(n.diameter)) d.diameter = coerce_integer(a->value);
    if (const auto* a = attrs.find(n.pressure)) d.pressure = coerce_real(a->value);

    // 1. diameter -> outer diameter
    std::optional<skill::Scalar> od;
    const skill::LookupTable* od_table = dsl.find_table(cfg.od_table);
    if (usable_key(d.diameter) && od_table) {
        if (const auto* row = od_table->find_row(0, d.diameter); row && row->size() >= 2) {
            od = (*row)[1];
            attrs.set(n.outer_diameter,
                      table_attr(*od, "mm", n.outer_diameter + "Φ(mm)",
                                 table_label(*od_table) + "：DN" + d.diameter.to_string() + "对应的公称外径为" +
                                     od->to_string() + "mm"));
            d.found.emplace_back(n.outer_diameter, *od);
        }
    }

    // 2. pressure -> series label
    std::optional<skill::Scalar> series;
    const skill::LookupTable* series_table = dsl.find_table(cfg.series_table);
    if (usable_key(d.pressure) && series_table) {
        if (const auto* row = series_table->find_row(0, d.pressure); row && row->size() >= 2) {
            series = (*row)[1];
            const skill::Scalar coeff = row->size() > 2 ? (*row)[2] : skill::Scalar(cfg.default_design_coefficient);
            attrs.set(n.series,
                      table_attr(*series, "", n.series + "(S)",
                                 table_label(*series_table) + "：设计系数C=" + coeff.to_string() + "时，PN" +
                                     d.pressure.to_string() + "对应" + series->to_string() + "系列"));
            d.found.emplace_back(n.series, *series);
        }
    }

    // 3. outer diameter + series -> minimum wall thickness (+ tolerance)
    if (!od) {
        if (const auto* a = attrs.find(n.outer_diameter)) od = a->value;
    }
    const skill::LookupTable* dim_table = dsl.find_table(cfg.dimension_table);
    if (!od || !usable_key(*od) || !series || !usable_key(*series) || !dim_table) return d;

    const std::string series_text = series->to_string();
    std::optional<size_t> series_col = dim_table->column_containing(series_text);
    if (!series_col) return d;

    const size_t key_col = dim_table->column_containing(cfg.key_column_hint).value_or(0);
    const auto* row = dim_table->find_row(key_col, *od);
    if (!row) return d;
    const skill::Scalar* thickness = cell(*row, *series_col);
    if (!thickness || thickness->is_null()) return d;

    attrs.set(n.wall_thickness,
              table_attr(*thickness, "mm", n.wall_thickness + "(e_min)",
                         table_label(*dim_table) + "：外径" + od->to_string() + "mm且为" + series_text +
                             "系列时，最小壁厚为" + thickness->to_string() + "mm"));
    d.found.emplace_back(n.wall_thickness, *thickness);

    const skill::LookupTable* tol_table = dsl.find_table(cfg.tolerance_table);
    auto thickness_num = thickness->numeric_value();
    if (!tol_table || !thickness_num) return d;

    if (auto tol = lookup_thickness_tolerance(*thickness_num, *tol_table)) {
        attrs.set(n.wall_tolerance,
                  table_attr(skill::Scalar("+" + tol->to_string()), "mm", n.wall_tolerance,
                             table_label(*tol_table) + "：外径" + od->to_string() + "mm且为" + series_text +
                                 "系列时，壁厚正偏差为" + tol->to_string() + "mm"));
        d.found.emplace_back(n.wall_tolerance, *tol);
    }
    return d;
}

}  // namespace runtime
