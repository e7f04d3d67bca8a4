#pragma once
#include <string>
#include <utility>
#include <vector>

// argv helpers shared by the subcommands: "--key value" pairs and bare flags.
// Malformed numbers throw std::runtime_error naming the flag.
bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// "easy=40,medium=30" -> {{"easy", 40}, {"medium", 30}}
std::vector<std::pair<std::string, int>> parse_distribution(const std::string& spec);
