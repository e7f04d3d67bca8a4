#pragma once

#include <optional>
#include <string>

#include "common/Json.hpp"

namespace skill {

// One table cell / attribute value: null, boolean, integer, real or text.
// Integers and reals compare numerically (100 == 100.0); text never equals a number,
// and a boolean only equals a boolean.
class Scalar {
public:
    enum class Kind { Null, Boolean, Integer, Real, Text };

    Scalar() = default;
    explicit Scalar(bool v) : m_kind(Kind::Boolean), m_bool(v) {}
    Scalar(int v) : m_kind(Kind::Integer), m_int(v) {}
    Scalar(long long v) : m_kind(Kind::Integer), m_int(v) {}
    Scalar(double v) : m_kind(Kind::Real), m_real(v) {}
    Scalar(const char* v) : m_kind(Kind::Text), m_text(v) {}
    Scalar(std::string v) : m_kind(Kind::Text), m_text(std::move(v)) {}

    Kind kind() const { return m_kind; }
    bool is_null() const { return m_kind == Kind::Null; }
    bool is_boolean() const { return m_kind == Kind::Boolean; }
    bool is_integer() const { return m_kind == Kind::Integer; }
    bool is_real() const { return m_kind == Kind::Real; }
    bool is_number() const { return m_kind == Kind::Integer || m_kind == Kind::Real; }
    bool is_text() const { return m_kind == Kind::Text; }

    bool as_boolean() const;
    long long as_integer() const;
    double as_number() const;
    const std::string& as_text() const;

    // number, or text that parses fully as a number ("5.3", " 12 ")
    std::optional<double> numeric_value() const;

    // "100", "1.6", "110.0", "true", text as-is, "null"
    std::string to_string() const;

    common::json to_json() const;
    static Scalar from_json(const common::json& j);  // throws std::runtime_error on arrays/objects

    // "100" -> 100, "1.6" -> 1.6; anything else is returned unchanged
    static Scalar coerce_decimal(const std::string& text);

    bool operator==(const Scalar& o) const;
    bool operator!=(const Scalar& o) const { return !(*this == o); }

private:
    Kind m_kind = Kind::Null;
    bool m_bool = false;
    long long m_int = 0;
    double m_real = 0.0;
    std::string m_text;
};

}  // namespace skill
