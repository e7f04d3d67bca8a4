#pragma once
#include <string>
#include <vector>

namespace textutil {

// ASCII-only lowercase; multi-byte UTF-8 sequences pass through untouched
std::string to_lower_ascii(const std::string& s);

std::string trim(const std::string& s);

// case-insensitive (ASCII) substring test
bool contains_ci(const std::string& haystack, const std::string& needle);

// lowercase, drop spaces / hyphens / underscores ("PVC-U" and "pvc u" both become "pvcu")
std::string compact_key(const std::string& s);

// split into UTF-8 code points (each element is one whole character)
std::vector<std::string> utf8_chars(const std::string& s);

// first n code points
std::string utf8_prefix(const std::string& s, size_t n);

// split on ASCII whitespace runs
std::vector<std::string> split_ws(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// collapse whitespace runs into one space and trim
std::string collapse_spaces(const std::string& s);

// returns true if a replacement happened
bool replace_first(std::string& s, const std::string& from, const std::string& to);
void replace_all(std::string& s, const std::string& from, const std::string& to);

// digits with at most one '.', e.g. "100", "1.6"; rejects "", ".", "1.2.3"
bool is_plain_decimal(const std::string& s);

}  // namespace textutil
