#include "common/TextUtil.hpp"

#include <cctype>

namespace textutil {

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::string compact_key(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : to_lower_ascii(trim(s))) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out.push_back(c);
    }
    return out;
}

static size_t utf8_len(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;  // stray continuation byte: keep it as its own unit
}

std::vector<std::string> utf8_chars(const std::string& s) {
    std::vector<std::string> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t n = utf8_len(static_cast<unsigned char>(s[i]));
        if (i + n > s.size()) n = s.size() - i;
        out.push_back(s.substr(i, n));
        i += n;
    }
    return out;
}

std::string utf8_prefix(const std::string& s, size_t n) {
    size_t i = 0;
    size_t count = 0;
    while (i < s.size() && count < n) {
        size_t len = utf8_len(static_cast<unsigned char>(s[i]));
        if (i + len > s.size()) len = s.size() - i;
        i += len;
        ++count;
    }
    return s.substr(0, i);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string collapse_spaces(const std::string& s) {
    return join(split_ws(s), " ");
}

bool replace_first(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return false;
    size_t pos = s.find(from);
    if (pos == std::string::npos) return false;
    s.replace(pos, from.size(), to);
    return true;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool is_plain_decimal(const std::string& s) {
    int digits = 0;
    int dots = 0;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            ++digits;
        } else if (c == '.') {
            if (++dots > 1) return false;
        } else {
            return false;
        }
    }
    return digits > 0;
}

}  // namespace textutil
