#include "commands/dataset.hpp"
#include "commands/generate.hpp"
#include "commands/parse.hpp"
#include "commands/run.hpp"
#include "commands/skills.hpp"
#include "commands/stats.hpp"

#include <exception>
#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill parse \"<text>\" [--trace] | --batch <file>\n"
        << "  gbskill stats\n"
        << "  gbskill skills list|show|publish|activate|deactivate|quarantined [args]\n"
        << "  gbskill dataset create|show|archive <datasetId> [args]\n"
        << "  gbskill generate --skill <id> | --template <id> --values <file> --dataset <id> [args]\n"
        << "  gbskill run create|exec|metrics|failed|results [args]\n"
        << "  gbskill help\n"
        << "\n"
        << "global:\n"
        << "  --config <path>              default: gbskill.json (optional)\n"
        << "  --repo <dir>                 default: data/repo\n"
        << "  --batch-size <n>             default: 10\n"
        << "  --seed <n>                   default: 42\n";
    return 1;
}

static int dispatch(int argc, char** argv) {
    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") return print_usage();

    if (cmd == "parse")    return cmd_parse(argc - 1, argv + 1);
    if (cmd == "stats")    return cmd_stats(argc - 1, argv + 1);
    if (cmd == "skills")   return cmd_skills(argc - 1, argv + 1);
    if (cmd == "dataset")  return cmd_dataset(argc - 1, argv + 1);
    if (cmd == "generate") return cmd_generate(argc - 1, argv + 1);
    if (cmd == "run")      return cmd_run(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    try {
        return dispatch(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
