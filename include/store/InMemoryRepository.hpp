#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "store/SkillRepository.hpp"

namespace store {

struct QuarantinedSkill {
    std::string source;  // file name or skill id
    std::string reason;
};

class InMemoryRepository : public SkillRepository {
public:
    InMemoryRepository() = default;

    // ---- SkillRepository ----
    std::vector<skill::Skill> list_skills(const std::optional<std::string>& domain = std::nullopt,
                                          const std::optional<skill::SkillStatus>& status = std::nullopt) const override;
    std::optional<skill::Skill> get_skill(const std::string& skill_id) const override;

    void append_execution_record(const runtime::ExecutionRecord& record) override;
    std::vector<runtime::ExecutionRecord> list_execution_records() const override;

    std::optional<bench::Dataset> load_dataset(const std::string& dataset_id) const override;
    void update_dataset(const bench::Dataset& dataset) override;
    std::vector<bench::Case> load_cases(const std::string& dataset_id) const override;
    void append_cases(const std::vector<bench::Case>& cases) override;

    void save_run(const bench::Run& run) override;
    std::optional<bench::Run> get_run(const std::string& run_id) const override;
    long long append_benchmark_result(const bench::Result& result) override;
    std::vector<bench::Result> list_results(const std::string& run_id) const override;

    std::optional<bench::GenerationTemplate> get_template(const std::string& template_id) const override;

    // ---- skill lifecycle ----

    // A new id starts a history; a changed payload under a known id appends the
    // next minor version. An unchanged payload only refreshes the metadata.
    // Returns the stored version.
    virtual skill::Skill publish_skill(skill::Skill s);

    // throws common::NotFoundError
    virtual void set_skill_status(const std::string& skill_id, skill::SkillStatus status);

    // oldest first; empty for an unknown id
    std::vector<skill::Skill> skill_versions(const std::string& skill_id) const;

    void quarantine(const std::string& source, const std::string& reason);
    std::vector<QuarantinedSkill> quarantined() const;

    virtual void put_template(const bench::GenerationTemplate& t);

protected:
    mutable std::mutex m_mu;

    std::vector<std::string> m_skill_order;  // first-publish order
    std::map<std::string, std::vector<skill::Skill>> m_skills;
    std::vector<QuarantinedSkill> m_quarantined;

    std::vector<runtime::ExecutionRecord> m_executions;
    std::vector<bench::Dataset> m_datasets;
    std::vector<bench::Case> m_cases;
    std::vector<bench::Run> m_runs;
    std::vector<bench::Result> m_results;
    long long m_next_result_id = 1;
    std::vector<bench::GenerationTemplate> m_templates;

    // callers hold m_mu
    skill::Skill publish_locked(skill::Skill s);
    void upsert_dataset_locked(const bench::Dataset& dataset);
    void upsert_run_locked(const bench::Run& run);
    void upsert_template_locked(const bench::GenerationTemplate& t);
};

}  // namespace store
