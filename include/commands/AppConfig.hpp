#pragma once
#include <string>

#include "bench/Models.hpp"
#include "common/Json.hpp"

// Settings shared by the subcommands. Defaults, then gbskill.json (or the
// file named by --config), then command-line flags.
struct AppConfig {
    std::string repository = "data/repo";  // JsonDirRepository root
    int batch_size = 10;                   // run checkpoint interval
    unsigned seed = 42;                    // generator seed
    bench::EvaluationConfig evaluation;
};

AppConfig app_config_from_json(const common::json& j);

// --config <path> (a missing default file is fine, a missing named file is not),
// --repo <dir>, --batch-size <n>, --seed <n>
AppConfig load_app_config(int argc, char** argv);
