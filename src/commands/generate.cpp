#include "commands/generate.hpp"

#include "bench/DataGenerator.hpp"
#include "commands/AppConfig.hpp"
#include "commands/Args.hpp"
#include "store/JsonDirRepository.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using json = common::json;

static int generate_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill generate --skill <id> --dataset <id> [options]\n"
        << "  gbskill generate --template <id> --values <file.json> --dataset <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --count <n>                  default: 100\n"
        << "  --dist <easy=40,medium=30,...>  percentages; default 40/30/20/10\n"
        << "  --difficulty <level>         template path only, default: medium\n"
        << "  --no-noise                   skip noise injection\n"
        << "  --no-variants                always use the canonical template\n"
        << "  --seed <n>                   default: 42 (or config)\n";
    return 1;
}

// {"材质": ["PVC-U", "PE"], "公称直径": [50, 100]}
static bench::ValueDomains read_value_lists(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open " + path);
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error(path + " must be an object of value lists");

    bench::ValueDomains out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array()) throw std::runtime_error(path + "." + it.key() + " must be an array");
        std::vector<skill::Scalar> values;
        for (const auto& v : it.value()) values.push_back(skill::Scalar::from_json(v));
        out.emplace_back(it.key(), std::move(values));
    }
    return out;
}

int cmd_generate(int argc, char** argv) {
    const std::string dataset = get_arg(argc, argv, "--dataset", "");
    const std::string skill_id = get_arg(argc, argv, "--skill", "");
    const std::string template_id = get_arg(argc, argv, "--template", "");
    if (dataset.empty() || (skill_id.empty() == template_id.empty())) return generate_usage();

    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);
    bench::DataGenerator gen(repo);

    const int count = get_arg_int(argc, argv, "--count", 100);
    if (count <= 0) throw std::runtime_error("--count must be positive");

    bench::GenerationResult res;
    if (!skill_id.empty()) {
        bench::GenerationOptions opt;
        opt.skill_id = skill_id;
        opt.count = count;
        opt.difficulty_distribution = parse_distribution(get_arg(argc, argv, "--dist", ""));
        opt.include_noise = !has_flag(argc, argv, "--no-noise");
        opt.include_variants = !has_flag(argc, argv, "--no-variants");
        opt.seed = cfg.seed;
        res = gen.generate_from_skill(opt, dataset);
    } else {
        const std::string values = get_arg(argc, argv, "--values", "");
        if (values.empty()) return generate_usage();
        const std::string level = get_arg(argc, argv, "--difficulty", "medium");
        auto difficulty = bench::parse_difficulty(level);
        if (!difficulty) throw std::runtime_error("unknown difficulty: " + level);
        res = gen.generate_from_template(template_id, read_value_lists(values), count, dataset, *difficulty, cfg.seed);
    }

    std::cout << res.to_json().dump(2) << "\n";
    return 0;
}
