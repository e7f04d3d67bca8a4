#include "commands/stats.hpp"

#include "commands/AppConfig.hpp"
#include "runtime/SkillRuntime.hpp"
#include "store/JsonDirRepository.hpp"

#include <iostream>

int cmd_stats(int argc, char** argv) {
    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);
    runtime::SkillRuntime rt(repo);

    std::cout << rt.stats().to_json().dump(2) << "\n";
    return 0;
}
