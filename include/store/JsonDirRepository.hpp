#pragma once

#include <filesystem>
#include <string>

#include "store/InMemoryRepository.hpp"

namespace store {

// InMemoryRepository backed by a directory:
//   skills/<id>@<version>.json   one skill record per file (plain <id>.json is read too)
//   datasets.json, runs.json, templates.json   arrays, rewritten on change
//   cases.jsonl, results.jsonl, executions.jsonl   append-only
// A skill file that fails to parse or validate is quarantined, not fatal.
class JsonDirRepository final : public InMemoryRepository {
public:
    explicit JsonDirRepository(std::filesystem::path root);

    const std::filesystem::path& root() const { return m_root; }

    void append_execution_record(const runtime::ExecutionRecord& record) override;
    void update_dataset(const bench::Dataset& dataset) override;
    void append_cases(const std::vector<bench::Case>& cases) override;
    void save_run(const bench::Run& run) override;
    long long append_benchmark_result(const bench::Result& result) override;

    skill::Skill publish_skill(skill::Skill s) override;
    void set_skill_status(const std::string& skill_id, skill::SkillStatus status) override;
    void put_template(const bench::GenerationTemplate& t) override;

private:
    std::filesystem::path m_root;

    void load_all();
    void load_skills();
    void write_skill_file(const skill::Skill& s) const;
    void write_datasets_locked() const;
    void write_runs_locked() const;
    void write_templates_locked() const;
};

// -1, 0, 1 comparing dotted numeric versions ("1.10.0" > "1.9.0")
int compare_versions(const std::string& a, const std::string& b);

}  // namespace store
