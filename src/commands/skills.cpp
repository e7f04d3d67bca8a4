#include "commands/skills.hpp"

#include "commands/AppConfig.hpp"
#include "commands/Args.hpp"
#include "common/Errors.hpp"
#include "store/JsonDirRepository.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using json = common::json;

static int skills_usage() {
    std::cerr
        << "usage:\n"
        << "  gbskill skills list [--domain <d>] [--status <s>]\n"
        << "  gbskill skills show <skillId> [--versions]\n"
        << "  gbskill skills publish <file.json> [--status <s>]\n"
        << "  gbskill skills activate <skillId>\n"
        << "  gbskill skills deactivate <skillId>\n"
        << "  gbskill skills quarantined\n";
    return 1;
}

static json skill_summary(const skill::Skill& s) {
    return {
        {"skill_id", s.skill_id},
        {"skill_name", s.skill_name},
        {"domain", s.domain},
        {"priority", s.priority},
        {"status", skill::to_string(s.status)},
        {"dsl_version", s.dsl_version}
    };
}

static skill::SkillStatus status_arg(const std::string& s) {
    auto st = skill::parse_skill_status(s);
    if (!st) throw std::runtime_error("unknown skill status: " + s);
    return *st;
}

int cmd_skills(int argc, char** argv) {
    if (argc < 2) return skills_usage();
    const std::string sub = argv[1];

    const AppConfig cfg = load_app_config(argc, argv);
    store::JsonDirRepository repo(cfg.repository);

    if (sub == "list") {
        std::optional<std::string> domain;
        std::optional<skill::SkillStatus> status;
        const std::string d = get_arg(argc, argv, "--domain", "");
        const std::string st = get_arg(argc, argv, "--status", "");
        if (!d.empty()) domain = d;
        if (!st.empty()) status = status_arg(st);

        json out = json::array();
        for (const auto& s : repo.list_skills(domain, status)) out.push_back(skill_summary(s));
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (sub == "quarantined") {
        json out = json::array();
        for (const auto& q : repo.quarantined()) out.push_back({{"source", q.source}, {"reason", q.reason}});
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (argc < 3) return skills_usage();
    const std::string target = argv[2];

    if (sub == "show") {
        if (has_flag(argc, argv, "--versions")) {
            json out = json::array();
            for (const auto& s : repo.skill_versions(target)) out.push_back(skill_summary(s));
            if (out.empty()) throw common::NotFoundError("skill", target);
            std::cout << out.dump(2) << "\n";
            return 0;
        }
        auto s = repo.get_skill(target);
        if (!s) throw common::NotFoundError("skill", target);
        std::cout << skill::skill_to_json(*s).dump(2) << "\n";
        return 0;
    }

    if (sub == "publish") {
        std::ifstream in(target);
        if (!in) throw std::runtime_error("failed to open " + target);
        json j;
        try {
            j = json::parse(in);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("invalid JSON in " + target + ": " + e.what());
        }
        // a bare DSL payload is wrapped into a record
        if (!j.contains("dsl_content")) j = {{"dsl_content", j}};
        skill::Skill s = skill::skill_from_json(j);
        const std::string st = get_arg(argc, argv, "--status", "");
        if (!st.empty()) s.status = status_arg(st);

        std::cout << skill_summary(repo.publish_skill(std::move(s))).dump(2) << "\n";
        return 0;
    }

    if (sub == "activate" || sub == "deactivate") {
        repo.set_skill_status(target, sub == "activate" ? skill::SkillStatus::Active : skill::SkillStatus::Deprecated);
        std::cout << skill_summary(*repo.get_skill(target)).dump(2) << "\n";
        return 0;
    }

    return skills_usage();
}
