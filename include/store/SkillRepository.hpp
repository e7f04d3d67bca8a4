#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bench/Models.hpp"
#include "runtime/ExecutionTrace.hpp"
#include "skill/Skill.hpp"

namespace store {

// Everything the runtime and the benchmark harness read or write.
// Implementations must be safe to call from several threads.
class SkillRepository {
public:
    virtual ~SkillRepository() = default;

    // ---- skills (latest version of each id) ----
    virtual std::vector<skill::Skill> list_skills(const std::optional<std::string>& domain = std::nullopt,
                                                  const std::optional<skill::SkillStatus>& status = std::nullopt) const = 0;
    virtual std::optional<skill::Skill> get_skill(const std::string& skill_id) const = 0;

    // ---- execution records (append-only) ----
    virtual void append_execution_record(const runtime::ExecutionRecord& record) = 0;
    virtual std::vector<runtime::ExecutionRecord> list_execution_records() const = 0;

    // ---- datasets and cases ----
    virtual std::optional<bench::Dataset> load_dataset(const std::string& dataset_id) const = 0;
    virtual void update_dataset(const bench::Dataset& dataset) = 0;  // insert or replace
    virtual std::vector<bench::Case> load_cases(const std::string& dataset_id) const = 0;  // insertion order
    virtual void append_cases(const std::vector<bench::Case>& cases) = 0;

    // ---- runs and results ----
    virtual void save_run(const bench::Run& run) = 0;  // insert or replace
    virtual std::optional<bench::Run> get_run(const std::string& run_id) const = 0;
    virtual long long append_benchmark_result(const bench::Result& result) = 0;  // returns the assigned id
    virtual std::vector<bench::Result> list_results(const std::string& run_id) const = 0;

    // ---- generation templates ----
    virtual std::optional<bench::GenerationTemplate> get_template(const std::string& template_id) const = 0;
};

}  // namespace store
