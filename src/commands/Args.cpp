#include "commands/Args.hpp"

#include <sstream>
#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
    if (used != s.size()) throw std::runtime_error(key + " expects an integer, got: " + s);
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(key + " expects a number, got: " + s);
    }
    if (used != s.size()) throw std::runtime_error(key + " expects a number, got: " + s);
    return v;
}

std::vector<std::pair<std::string, int>> parse_distribution(const std::string& spec) {
    std::vector<std::pair<std::string, int>> out;
    std::istringstream in(spec);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (item.empty()) continue;
        const size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) throw std::runtime_error("bad distribution entry: " + item);
        const std::string pct = item.substr(eq + 1);
        size_t used = 0;
        int n = 0;
        try {
            n = std::stoi(pct, &used);
        } catch (const std::logic_error&) {
            throw std::runtime_error("bad distribution percentage: " + item);
        }
        if (used != pct.size()) throw std::runtime_error("bad distribution percentage: " + item);
        out.emplace_back(item.substr(0, eq), n);
    }
    return out;
}
