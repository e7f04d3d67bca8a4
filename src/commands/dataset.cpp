#include "commands/dataset.hpp"

#include "commands/AppConfig.hpp"
#include "commands/Args.hpp"
#include "common/Errors.hpp"
#include "store/JsonDirRepository.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static int dataset_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill dataset create <datasetId> [--name <str>] [--skill <skillId>] [--description <str>]\n"
        << "  gbskill dataset show <datasetId>\n"
        << "  gbskill dataset archive <datasetId>\n";
    return 1;
}

int cmd_dataset(int argc, char** argv) {
    if (argc < 3) return dataset_usage();
    const std::string sub = argv[1];
    const std::string id = argv[2];

    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);

    if (sub == "create") {
        if (repo.load_dataset(id)) throw std::runtime_error("dataset already exists: " + id);
        bench::Dataset ds;
        ds.id = id;
        ds.name = get_arg(argc, argv, "--name", id);
        ds.description = get_arg(argc, argv, "--description", "");
        const std::string skill_id = get_arg(argc, argv, "--skill", "");
        if (!skill_id.empty()) ds.skill_id = skill_id;
        repo.update_dataset(ds);
        std::cout << ds.to_json().dump(2) << "\n";
        return 0;
    }

    auto ds = repo.load_dataset(id);
    if (!ds) throw common::NotFoundError("dataset", id);

    if (sub == "show") {
        std::cout << ds->to_json().dump(2) << "\n";
        return 0;
    }
    if (sub == "archive") {
        ds->status = bench::DatasetStatus::Archived;
        repo.update_dataset(*ds);
        std::cout << ds->to_json().dump(2) << "\n";
        return 0;
    }
    return dataset_usage();
}
