#include "commands/run.hpp"

#include "bench/EvaluationService.hpp"
#include "commands/AppConfig.hpp"
#include "commands/Args.hpp"
#include "runtime/SkillRuntime.hpp"
#include "store/JsonDirRepository.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using json = common::json;

static int run_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill run create --dataset <id> [--name <str>] [--tolerance <f>] [--no-partial] [--skip-skill-match]\n"
        << "  gbskill run exec <runId>\n"
        << "  gbskill run metrics <runId>\n"
        << "  gbskill run failed <runId>\n"
        << "  gbskill run results <runId> [--status success,error] [--difficulty easy,hard] [--limit n] [--offset n]\n";
    return 1;
}

template <typename T, typename ParseFn>
static std::vector<T> parse_list(const std::string& csv, ParseFn parse, const char* what) {
    std::vector<T> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto v = parse(item);
        if (!v) throw std::runtime_error(std::string("unknown ") + what + ": " + item);
        out.push_back(*v);
    }
    return out;
}

int cmd_run(int argc, char** argv) {
    if (argc < 2) return run_usage();
    const std::string sub = argv[1];

    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);
    runtime::SkillRuntime rt(repo);
    bench::EvaluationService svc(repo, rt, cfg.batch_size);

    if (sub == "create") {
        const std::string dataset = get_arg(argc, argv, "--dataset", "");
        if (dataset.empty()) return run_usage();

        bench::EvaluationConfig ec = cfg.evaluation;
        ec.tolerance = get_arg_double(argc, argv, "--tolerance", ec.tolerance);
        if (has_flag(argc, argv, "--no-partial")) ec.partial_match = false;
        if (has_flag(argc, argv, "--skip-skill-match")) ec.skip_skill_match = true;

        const bench::Run run = svc.create_run(dataset, ec, get_arg(argc, argv, "--name", ""),
                                              get_arg(argc, argv, "--description", ""));
        std::cout << run.to_json().dump(2) << "\n";
        return 0;
    }

    if (argc < 3) return run_usage();
    const std::string run_id = argv[2];

    if (sub == "exec") {
        const bench::Run run = svc.execute_run(run_id);
        std::cout << run.to_json().dump(2) << "\n";
        return run.status == bench::RunStatus::Completed ? 0 : 2;
    }
    if (sub == "metrics") {
        std::cout << svc.get_run_metrics(run_id).to_json().dump(2) << "\n";
        return 0;
    }
    if (sub == "failed") {
        json arr = json::array();
        for (const auto& fc : svc.get_failed_cases(run_id)) arr.push_back(fc.to_json());
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (sub == "results") {
        bench::ResultQuery q;
        q.statuses = parse_list<bench::ResultStatus>(get_arg(argc, argv, "--status", ""),
                                                     bench::parse_result_status, "status");
        q.difficulties = parse_list<bench::Difficulty>(get_arg(argc, argv, "--difficulty", ""),
                                                       bench::parse_difficulty, "difficulty");
        const int limit = get_arg_int(argc, argv, "--limit", 100);
        const int offset = get_arg_int(argc, argv, "--offset", 0);
        if (limit < 0 || offset < 0) throw std::runtime_error("--limit and --offset must be non-negative");
        q.limit = static_cast<size_t>(limit);
        q.offset = static_cast<size_t>(offset);

        const bench::ResultPage page = svc.get_run_results(run_id, q);
        json out;
        out["total"] = page.total;
        out["results"] = json::array();
        for (const auto& r : page.results) out["results"].push_back(r.to_json());
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    return run_usage();
}
