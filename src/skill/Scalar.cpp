#include "skill/Scalar.hpp"

#include <cstdlib>
#include <stdexcept>

#include "common/TextUtil.hpp"

namespace skill {

bool Scalar::as_boolean() const {
    if (m_kind != Kind::Boolean) throw std::runtime_error("scalar is not a boolean: " + to_string());
    return m_bool;
}

long long Scalar::as_integer() const {
    if (m_kind == Kind::Integer) return m_int;
    if (m_kind == Kind::Real) return static_cast<long long>(m_real);
    throw std::runtime_error("scalar is not numeric: " + to_string());
}

double Scalar::as_number() const {
    if (m_kind == Kind::Integer) return static_cast<double>(m_int);
    if (m_kind == Kind::Real) return m_real;
    throw std::runtime_error("scalar is not numeric: " + to_string());
}

const std::string& Scalar::as_text() const {
    if (m_kind != Kind::Text) throw std::runtime_error("scalar is not text: " + to_string());
    return m_text;
}

std::optional<double> Scalar::numeric_value() const {
    if (is_number()) return as_number();
    if (m_kind != Kind::Text) return std::nullopt;

    const std::string t = textutil::trim(m_text);
    if (t.empty()) return std::nullopt;

    const char* begin = t.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end != begin + t.size()) return std::nullopt;
    return v;
}

std::string Scalar::to_string() const {
    switch (m_kind) {
        case Kind::Null: return "null";
        case Kind::Boolean: return m_bool ? "true" : "false";
        case Kind::Integer: return std::to_string(m_int);
        case Kind::Real: return common::json(m_real).dump();
        case Kind::Text: return m_text;
    }
    return "";
}

common::json Scalar::to_json() const {
    switch (m_kind) {
        case Kind::Null: return nullptr;
        case Kind::Boolean: return m_bool;
        case Kind::Integer: return m_int;
        case Kind::Real: return m_real;
        case Kind::Text: return m_text;
    }
    return nullptr;
}

Scalar Scalar::from_json(const common::json& j) {
    if (j.is_null()) return Scalar();
    if (j.is_boolean()) return Scalar(j.get<bool>());
    if (j.is_number_integer()) return Scalar(j.get<long long>());
    if (j.is_number_float()) return Scalar(j.get<double>());
    if (j.is_string()) return Scalar(j.get<std::string>());
    throw std::runtime_error("expected a scalar (boolean, number, string or null)");
}

Scalar Scalar::coerce_decimal(const std::string& text) {
    if (!textutil::is_plain_decimal(text)) return Scalar(text);
    if (text.find('.') != std::string::npos) return Scalar(std::strtod(text.c_str(), nullptr));
    return Scalar(std::strtoll(text.c_str(), nullptr, 10));
}

bool Scalar::operator==(const Scalar& o) const {
    if (is_number() && o.is_number()) {
        if (is_integer() && o.is_integer()) return m_int == o.m_int;
        return as_number() == o.as_number();
    }
    if (m_kind != o.m_kind) return false;
    if (m_kind == Kind::Text) return m_text == o.m_text;
    if (m_kind == Kind::Boolean) return m_bool == o.m_bool;
    return true;  // both null
}

}  // namespace skill
