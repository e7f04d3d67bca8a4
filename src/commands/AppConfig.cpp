#include "commands/AppConfig.hpp"

#include "commands/Args.hpp"
#include "common/Log.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = common::json;

AppConfig app_config_from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("config must be an object");

    AppConfig cfg;
    cfg.repository = j.value("repository", cfg.repository);
    cfg.batch_size = j.value("batch_size", cfg.batch_size);
    cfg.seed = j.value("seed", cfg.seed);
    if (j.contains("evaluation")) {
        if (!j.at("evaluation").is_object()) throw std::runtime_error("config.evaluation must be an object");
        cfg.evaluation = bench::EvaluationConfig::from_json(j.at("evaluation"));
    }
    if (cfg.batch_size <= 0) throw std::runtime_error("config.batch_size must be positive");
    return cfg;
}

AppConfig load_app_config(int argc, char** argv) {
    const std::string named = get_arg(argc, argv, "--config", "");
    const fs::path path = named.empty() ? fs::path("gbskill.json") : fs::path(named);

    AppConfig cfg;
    if (fs::exists(path)) {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("failed to open config: " + path.string());
        json j;
        try {
            j = json::parse(in);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("invalid config " + path.string() + ": " + e.what());
        }
        cfg = app_config_from_json(j);
        logging::info("Config", "loaded " + path.string());
    } else if (!named.empty()) {
        throw std::runtime_error("config not found: " + named);
    }

    cfg.repository = get_arg(argc, argv, "--repo", cfg.repository);
    cfg.batch_size = get_arg_int(argc, argv, "--batch-size", cfg.batch_size);
    cfg.seed = static_cast<unsigned>(get_arg_int(argc, argv, "--seed", static_cast<int>(cfg.seed)));
    if (cfg.batch_size <= 0) throw std::runtime_error("--batch-size must be positive");
    return cfg;
}
