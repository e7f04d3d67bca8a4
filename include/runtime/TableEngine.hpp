#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Json.hpp"
#include "runtime/Models.hpp"
#include "skill/SkillDsl.hpp"

namespace runtime {

struct TableEngineConfig {
    std::string od_table = "dn_outer_diameter_map";
    std::string series_table = "series_mapping";
    std::string dimension_table = "dimension_table";
    std::string tolerance_table = "wall_thickness_tolerance";
    std::string key_column_hint = "外径";  // dimension_table row key column
    double default_design_coefficient = 2.0;
    AttributeNames names;
};

struct TableDerivation {
    skill::Scalar diameter;  // lookup key after coercion, null if absent
    skill::Scalar pressure;
    std::vector<std::pair<std::string, skill::Scalar>> found;  // derived name -> value, derivation order
    size_t table_count = 0;

    common::json input_json() const;
    common::json output_json() const;
};

// Derivation chain: diameter -> outer diameter; pressure -> series;
// outer diameter + series -> minimum wall thickness -> thickness tolerance.
// A miss at any step omits that attribute and everything depending on it.
// Derived attributes overwrite extracted ones of the same name.
TableDerivation derive_from_tables(AttributeSet& attrs, const skill::SkillDsl& dsl,
                                   const TableEngineConfig& cfg = TableEngineConfig{});

// "6.1-10.0" style range rows; nullopt when no row covers the thickness
std::optional<skill::Scalar> lookup_thickness_tolerance(double wall_thickness, const skill::LookupTable& table);

}  // namespace runtime
