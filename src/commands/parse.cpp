#include "commands/parse.hpp"

#include "commands/AppConfig.hpp"
#include "commands/Args.hpp"
#include "runtime/SkillRuntime.hpp"
#include "store/JsonDirRepository.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = common::json;

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill parse \"<material text>\" [--trace]\n"
        << "  gbskill parse --batch <file>          one description per line\n";
    return 1;
}

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open " + path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        lines.push_back(line);
    }
    return lines;
}

int cmd_parse(int argc, char** argv) {
    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);
    runtime::SkillRuntime rt(repo);

    const std::string batch = get_arg(argc, argv, "--batch", "");
    if (!batch.empty()) {
        json out = json::array();
        for (const auto& item : rt.execute_batch(read_lines(batch))) {
            json j = {{"input_text", item.input_text}};
            if (item.response) {
                j["status"] = "success";
                j["trace_id"] = item.response->trace_id;
                j["matched_skill_id"] = item.response->matched_skill_id ? json(*item.response->matched_skill_id)
                                                                        : json(nullptr);
                j["result"] = item.response->result.to_json();
            } else {
                j["status"] = "failed";
                j["error"] = item.error;
            }
            out.push_back(std::move(j));
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) return parse_usage();

    runtime::ParseResponse resp = rt.execute(argv[1], runtime::new_trace_id());
    json j = resp.to_json();
    if (!has_flag(argc, argv, "--trace")) j.erase("execution_trace");
    std::cout << j.dump(2) << "\n";
    return 0;
}
