#include "skill/SkillDsl.hpp"

#include <initializer_list>
#include <sstream>

#include "common/Errors.hpp"
#include "common/Log.hpp"

using json = common::json;

namespace skill {

const char* to_string(AttributeType t) {
    switch (t) {
        case AttributeType::Dimension: return "dimension";
        case AttributeType::Material: return "material";
        case AttributeType::Performance: return "performance";
        case AttributeType::Specification: return "specification";
        case AttributeType::Category: return "category";
        default: return "unknown";
    }
}

std::optional<AttributeType> parse_attribute_type(const std::string& s) {
    if (s == "dimension") return AttributeType::Dimension;
    if (s == "material") return AttributeType::Material;
    if (s == "performance") return AttributeType::Performance;
    if (s == "specification") return AttributeType::Specification;
    if (s == "category") return AttributeType::Category;
    return std::nullopt;
}

std::optional<size_t> LookupTable::column_containing(const std::string& needle) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].find(needle) != std::string::npos) return i;
    }
    return std::nullopt;
}

const std::vector<Scalar>* LookupTable::find_row(size_t key_col, const Scalar& key) const {
    for (const auto& row : rows) {
        if (row.size() > key_col && row[key_col] == key) return &row;
    }
    return nullptr;
}

const AttributeSpec* SkillDsl::find_attribute(const std::string& name) const {
    for (const auto& a : attributes) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

const LookupTable* SkillDsl::find_table(const std::string& name) const {
    for (const auto& t : tables) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

// ---------- regex ----------

static bool is_multibyte_lead(unsigned char c) { return c >= 0xC0; }

static size_t char_len_at(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t n = 1;
    if ((c >> 5) == 0x6) n = 2;
    else if ((c >> 4) == 0xE) n = 3;
    else if ((c >> 3) == 0x1E) n = 4;
    if (i + n > s.size()) n = s.size() - i;
    return n;
}

std::string rewrite_multibyte_classes(const std::string& p) {
    std::string out;
    out.reserve(p.size() + 16);

    size_t i = 0;
    while (i < p.size()) {
        const char c = p[i];

        if (c == '\\') {
            out.push_back(c);
            if (i + 1 < p.size()) {
                size_t n = char_len_at(p, i + 1);
                out.append(p, i + 1, n);
                i += 1 + n;
            } else {
                ++i;
            }
            continue;
        }

        if (c != '[') {
            size_t n = char_len_at(p, i);
            out.append(p, i, n);
            i += n;
            continue;
        }

        // bracket expression: collect items up to the closing ']'
        size_t j = i + 1;
        bool negated = false;
        if (j < p.size() && p[j] == '^') {
            negated = true;
            ++j;
        }

        std::vector<std::string> ascii_items;
        std::vector<std::string> mb_items;
        bool mb_in_range = false;
        bool closed = false;
        bool first = true;

        while (j < p.size()) {
            if (p[j] == ']' && !first) {
                closed = true;
                break;
            }
            first = false;

            std::string item;
            if (p[j] == '\\' && j + 1 < p.size()) {
                size_t n = char_len_at(p, j + 1);
                item = p.substr(j, 1 + n);
                j += 1 + n;
            } else {
                size_t n = char_len_at(p, j);
                item = p.substr(j, n);
                j += n;
            }

            // range "a-b"
            if (j + 1 < p.size() && p[j] == '-' && p[j + 1] != ']') {
                size_t n = char_len_at(p, j + 1);
                std::string hi = p.substr(j + 1, n);
                j += 1 + n;
                if (is_multibyte_lead(static_cast<unsigned char>(item[0])) ||
                    is_multibyte_lead(static_cast<unsigned char>(hi[0]))) {
                    mb_in_range = true;
                }
                ascii_items.push_back(item + "-" + hi);
                continue;
            }

            if (is_multibyte_lead(static_cast<unsigned char>(item[0]))) mb_items.push_back(item);
            else ascii_items.push_back(item);
        }

        if (!closed) {
            // unterminated: leave the rest alone, std::regex will report it
            out.append(p, i, std::string::npos);
            break;
        }

        const std::string original = p.substr(i, j + 1 - i);
        i = j + 1;

        if (negated || mb_items.empty() || mb_in_range) {
            out += original;
            continue;
        }

        out += "(?:";
        bool need_bar = false;
        if (!ascii_items.empty()) {
            out += "[";
            for (const auto& a : ascii_items) out += a;
            out += "]";
            need_bar = true;
        }
        for (const auto& m : mb_items) {
            if (need_bar) out += "|";
            out += m;
            need_bar = true;
        }
        out += ")";
    }

    return out;
}

std::optional<CompiledPattern> compile_pattern(const std::string& pattern, const std::string& where) {
    try {
        CompiledPattern cp;
        cp.source = pattern;
        cp.re = std::regex(rewrite_multibyte_classes(pattern),
                           std::regex::ECMAScript | std::regex::icase);
        return cp;
    } catch (const std::regex_error& e) {
        logging::warn("SkillDsl", "invalid pattern at " + where + " (" + pattern + "): " + e.what() +
                                      "; pattern skipped");
        return std::nullopt;
    }
}

// ---------- parsing helpers ----------

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) throw common::DslError(where + " must be an object");
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) throw common::DslError(where + " must be an array");
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return std::nullopt;
    const json& v = j.at(key);
    if (!v.is_string()) throw common::DslError(where + "." + key + " must be a string");
    return v.get<std::string>();
}

static std::vector<std::string> string_array(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw common::DslError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static Scalar scalar_at(const json& j, const std::string& where) {
    try {
        return Scalar::from_json(j);
    } catch (const std::exception& e) {
        throw common::DslError(where + ": " + e.what());
    }
}

static std::vector<CompiledPattern> compile_all(const std::vector<std::string>& patterns, const std::string& where) {
    std::vector<CompiledPattern> out;
    out.reserve(patterns.size());
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        auto cp = compile_pattern(patterns[i], oss.str());
        if (cp) out.push_back(std::move(*cp));
    }
    return out;
}

static std::vector<std::string> keys_of(const json& j) {
    std::vector<std::string> keys;
    keys.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    return keys;
}

// keys of `j` outside `known`, in source order
static json unknown_keys(const json& j, std::initializer_list<const char*> known) {
    json out = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool is_known = false;
        for (const char* k : known) {
            if (it.key() == k) {
                is_known = true;
                break;
            }
        }
        if (!is_known) out[it.key()] = it.value();
    }
    return out;
}

static Recognition parse_recognition(const json& j, const std::string& where) {
    require_object(j, where);
    Recognition r;
    r.key_order = keys_of(j);
    if (j.contains("keywords")) {
        r.keywords = string_array(j.at("keywords"), where + ".keywords");
        r.has_keywords = true;
    }
    if (j.contains("patterns")) {
        r.patterns = string_array(j.at("patterns"), where + ".patterns");
        r.has_patterns = true;
    }
    r.extras = unknown_keys(j, {"keywords", "patterns"});
    r.compiled = compile_all(r.patterns, where + ".patterns");
    return r;
}

static AttributeSpec parse_attribute(const std::string& name, const json& j, const std::string& where) {
    require_object(j, where);

    AttributeSpec a;
    a.name = name;
    a.key_order = keys_of(j);

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();

        if (key == "type") {
            if (!v.is_string()) throw common::DslError(where + ".type must be a string");
            auto t = parse_attribute_type(v.get<std::string>());
            if (!t) throw common::DslError(where + ".type has unknown value: " + v.get<std::string>());
            a.type = *t;
        } else if (key == "unit") {
            a.unit = optional_string(j, "unit", where);
        } else if (key == "patterns") {
            a.patterns = string_array(v, where + ".patterns");
            a.has_patterns = true;
        } else if (key == "required") {
            if (!v.is_boolean()) throw common::DslError(where + ".required must be a boolean");
            a.required = v.get<bool>();
        } else if (key == "defaultValue") {
            a.default_value = scalar_at(v, where + ".defaultValue");
        } else if (key == "allowedValues") {
            require_array(v, where + ".allowedValues");
            a.has_allowed_values = true;
            for (size_t i = 0; i < v.size(); ++i) {
                std::ostringstream oss;
                oss << where << ".allowedValues[" << i << "]";
                a.allowed_values.push_back(scalar_at(v.at(i), oss.str()));
            }
        } else if (key == "displayName") {
            a.display_name = optional_string(j, "displayName", where);
        } else if (key == "description") {
            a.description = optional_string(j, "description", where);
        } else {
            a.extras[key] = v;
        }
    }

    if (!j.contains("type")) throw common::DslError(where + " missing required field: type");

    a.compiled = compile_all(a.patterns, where + ".patterns");
    return a;
}

static LookupTable parse_table(const std::string& name, const json& j, const std::string& where) {
    require_object(j, where);

    LookupTable t;
    t.name = name;
    t.key_order = keys_of(j);
    t.description = optional_string(j, "description", where);

    if (!j.contains("columns")) throw common::DslError(where + " missing required field: columns");
    t.columns = string_array(j.at("columns"), where + ".columns");

    const char* rows_key = j.contains("data") ? "data" : (j.contains("rows") ? "rows" : nullptr);
    if (!rows_key) throw common::DslError(where + " missing required field: data");
    t.rows_key = rows_key;
    t.extras = unknown_keys(j, {"description", "columns", rows_key});

    const json& rows = j.at(rows_key);
    const std::string rows_where = where + "." + rows_key;
    require_array(rows, rows_where);

    t.rows.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        std::ostringstream oss;
        oss << rows_where << "[" << r << "]";
        const json& row = rows.at(r);
        require_array(row, oss.str());
        if (row.size() > t.columns.size()) {
            throw common::DslError(oss.str() + " has more cells than columns");
        }

        std::vector<Scalar> cells;
        cells.reserve(row.size());
        for (size_t c = 0; c < row.size(); ++c) {
            std::ostringstream cw;
            cw << oss.str() << "[" << c << "]";
            cells.push_back(scalar_at(row.at(c), cw.str()));
        }
        t.rows.push_back(std::move(cells));
    }

    return t;
}

static RuleSpec parse_rule(const std::string& name, const json& j, const std::string& where) {
    require_object(j, where);

    RuleSpec r;
    r.name = name;
    r.key_order = keys_of(j);
    r.declared_source = optional_string(j, "sourceAttribute", where);
    r.source_attribute = r.declared_source.value_or(name);
    r.target_attribute = optional_string(j, "targetAttribute", where);
    r.type = optional_string(j, "type", where);
    r.mapping_table = optional_string(j, "mappingTable", where);
    r.display_name = optional_string(j, "displayName", where);
    r.description = optional_string(j, "description", where);
    r.extras = unknown_keys(j, {"sourceAttribute", "targetAttribute", "type", "mappingTable", "displayName",
                                "description", "mapping"});

    if (j.contains("mapping")) {
        const json& m = j.at("mapping");
        require_object(m, where + ".mapping");
        r.has_mapping = true;
        for (auto it = m.begin(); it != m.end(); ++it) {
            r.mapping.emplace_back(it.key(), scalar_at(it.value(), where + ".mapping." + it.key()));
        }
    }

    return r;
}

static CategoryMapping parse_category(const json& j, const std::string& where) {
    require_object(j, where);
    CategoryMapping c;
    c.key_order = keys_of(j);
    c.primary = optional_string(j, "primaryCategory", where);
    c.secondary = optional_string(j, "secondaryCategory", where);
    c.tertiary = optional_string(j, "tertiaryCategory", where);
    c.quaternary = optional_string(j, "quaternaryCategory", where);
    c.category_id = optional_string(j, "categoryId", where);
    c.common_name = optional_string(j, "commonName", where);
    c.extras = unknown_keys(j, {"primaryCategory", "secondaryCategory", "tertiaryCategory", "quaternaryCategory",
                                "categoryId", "commonName"});
    return c;
}

static FallbackPolicy parse_fallback(const json& j, const std::string& where) {
    require_object(j, where);
    FallbackPolicy f;
    f.key_order = keys_of(j);
    if (j.contains("lowConfidenceThreshold")) {
        if (!j.at("lowConfidenceThreshold").is_number()) {
            throw common::DslError(where + ".lowConfidenceThreshold must be a number");
        }
        f.low_confidence_threshold = j.at("lowConfidenceThreshold").get<double>();
    }
    if (j.contains("humanReviewRequired")) {
        if (!j.at("humanReviewRequired").is_boolean()) {
            throw common::DslError(where + ".humanReviewRequired must be a boolean");
        }
        f.human_review_required = j.at("humanReviewRequired").get<bool>();
    }
    f.extras = unknown_keys(j, {"lowConfidenceThreshold", "humanReviewRequired"});
    return f;
}

SkillDsl parse_skill_dsl(const json& j) {
    const std::string root = "root";
    require_object(j, root);

    SkillDsl dsl;
    dsl.key_order = keys_of(j);

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();
        const std::string where = root + "." + key;

        if (key == "skillId") {
            dsl.skill_id = optional_string(j, "skillId", root);
        } else if (key == "skillName") {
            dsl.skill_name = optional_string(j, "skillName", root);
        } else if (key == "version") {
            dsl.version = optional_string(j, "version", root);
        } else if (key == "standardCode") {
            dsl.standard_code = optional_string(j, "standardCode", root);
        } else if (key == "domain") {
            dsl.domain = optional_string(j, "domain", root);
        } else if (key == "priority") {
            if (!v.is_number_integer()) throw common::DslError(where + " must be an integer");
            dsl.priority = v.get<int>();
        } else if (key == "applicableMaterialTypes") {
            dsl.applicable_material_types = string_array(v, where);
        } else if (key == "intentRecognition") {
            dsl.recognition = parse_recognition(v, where);
        } else if (key == "attributeExtraction") {
            require_object(v, where);
            dsl.has_attributes = true;
            for (auto a = v.begin(); a != v.end(); ++a) {
                dsl.attributes.push_back(parse_attribute(a.key(), a.value(), where + "." + a.key()));
            }
        } else if (key == "tables") {
            require_object(v, where);
            dsl.has_tables = true;
            for (auto t = v.begin(); t != v.end(); ++t) {
                dsl.tables.push_back(parse_table(t.key(), t.value(), where + "." + t.key()));
            }
        } else if (key == "rules") {
            require_object(v, where);
            dsl.has_rules = true;
            for (auto r = v.begin(); r != v.end(); ++r) {
                dsl.rules.push_back(parse_rule(r.key(), r.value(), where + "." + r.key()));
            }
        } else if (key == "categoryMapping") {
            dsl.category = parse_category(v, where);
        } else if (key == "fallbackStrategy") {
            dsl.fallback = parse_fallback(v, where);
        } else {
            dsl.extensions[key] = v;
        }
    }

    return dsl;
}

// ---------- serialization ----------

template <typename T>
static void put_opt(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

static void put_extras(json& j, const json& extras) {
    for (auto it = extras.begin(); it != extras.end(); ++it) j[it.key()] = it.value();
}

// `fields` re-keyed in the recorded source order; keys the order does not
// name (objects built in code) follow in their own order.
static json in_source_order(const json& fields, const std::vector<std::string>& order) {
    if (order.empty()) return fields;
    json out = json::object();
    for (const auto& k : order) {
        auto it = fields.find(k);
        if (it != fields.end()) out[k] = *it;
    }
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (!out.contains(it.key())) out[it.key()] = it.value();
    }
    return out;
}

static json recognition_to_json(const Recognition& r) {
    json j = json::object();
    if (r.has_keywords || !r.keywords.empty()) j["keywords"] = r.keywords;
    if (r.has_patterns || !r.patterns.empty()) j["patterns"] = r.patterns;
    put_extras(j, r.extras);
    return in_source_order(j, r.key_order);
}

static json attribute_to_json(const AttributeSpec& a) {
    json j = json::object();
    j["type"] = to_string(a.type);
    put_opt(j, "unit", a.unit);
    if (a.has_patterns || !a.patterns.empty()) j["patterns"] = a.patterns;
    put_opt(j, "required", a.required);
    if (a.default_value) j["defaultValue"] = a.default_value->to_json();
    if (a.has_allowed_values || !a.allowed_values.empty()) {
        json arr = json::array();
        for (const auto& v : a.allowed_values) arr.push_back(v.to_json());
        j["allowedValues"] = arr;
    }
    put_opt(j, "displayName", a.display_name);
    put_opt(j, "description", a.description);
    put_extras(j, a.extras);
    return in_source_order(j, a.key_order);
}

static json table_to_json(const LookupTable& t) {
    json j = json::object();
    put_opt(j, "description", t.description);
    j["columns"] = t.columns;
    json rows = json::array();
    for (const auto& row : t.rows) {
        json r = json::array();
        for (const auto& cell : row) r.push_back(cell.to_json());
        rows.push_back(r);
    }
    j[t.rows_key] = rows;
    put_extras(j, t.extras);
    return in_source_order(j, t.key_order);
}

static json rule_to_json(const RuleSpec& r) {
    json j = json::object();
    put_opt(j, "type", r.type);
    put_opt(j, "sourceAttribute", r.declared_source);
    put_opt(j, "targetAttribute", r.target_attribute);
    if (r.has_mapping) {
        json m = json::object();
        for (const auto& [k, v] : r.mapping) m[k] = v.to_json();
        j["mapping"] = m;
    }
    put_opt(j, "mappingTable", r.mapping_table);
    put_opt(j, "displayName", r.display_name);
    put_opt(j, "description", r.description);
    put_extras(j, r.extras);
    return in_source_order(j, r.key_order);
}

static json category_to_json(const CategoryMapping& c) {
    json j = json::object();
    put_opt(j, "primaryCategory", c.primary);
    put_opt(j, "secondaryCategory", c.secondary);
    put_opt(j, "tertiaryCategory", c.tertiary);
    put_opt(j, "quaternaryCategory", c.quaternary);
    put_opt(j, "categoryId", c.category_id);
    put_opt(j, "commonName", c.common_name);
    put_extras(j, c.extras);
    return in_source_order(j, c.key_order);
}

static json fallback_to_json(const FallbackPolicy& f) {
    json j = json::object();
    put_opt(j, "lowConfidenceThreshold", f.low_confidence_threshold);
    put_opt(j, "humanReviewRequired", f.human_review_required);
    put_extras(j, f.extras);
    return in_source_order(j, f.key_order);
}

json skill_dsl_to_json(const SkillDsl& dsl) {
    json j = json::object();

    put_opt(j, "skillId", dsl.skill_id);
    put_opt(j, "skillName", dsl.skill_name);
    put_opt(j, "version", dsl.version);
    put_opt(j, "standardCode", dsl.standard_code);
    put_opt(j, "domain", dsl.domain);
    put_opt(j, "priority", dsl.priority);
    put_opt(j, "applicableMaterialTypes", dsl.applicable_material_types);

    if (dsl.recognition) j["intentRecognition"] = recognition_to_json(*dsl.recognition);

    if (dsl.has_attributes) {
        json attrs = json::object();
        for (const auto& a : dsl.attributes) attrs[a.name] = attribute_to_json(a);
        j["attributeExtraction"] = attrs;
    }

    if (dsl.has_tables) {
        json tables = json::object();
        for (const auto& t : dsl.tables) tables[t.name] = table_to_json(t);
        j["tables"] = tables;
    }

    if (dsl.has_rules) {
        json rules = json::object();
        for (const auto& r : dsl.rules) rules[r.name] = rule_to_json(r);
        j["rules"] = rules;
    }

    if (dsl.category) j["categoryMapping"] = category_to_json(*dsl.category);
    if (dsl.fallback) j["fallbackStrategy"] = fallback_to_json(*dsl.fallback);
    put_extras(j, dsl.extensions);

    return in_source_order(j, dsl.key_order);
}

}  // namespace skill
