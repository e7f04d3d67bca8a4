#include "store/InMemoryRepository.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace store {

std::vector<skill::Skill> InMemoryRepository::list_skills(const std::optional<std::string>& domain,
                                                          const std::optional<skill::SkillStatus>& status) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::vector<skill::Skill> out;
    for (const auto& id : m_skill_order) {
        const skill::Skill& latest = m_skills.at(id).back();
        if (domain && latest.domain != *domain) continue;
        if (status && latest.status != *status) continue;
        out.push_back(latest);
    }
    return out;
}

std::optional<skill::Skill> InMemoryRepository::get_skill(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_skills.find(skill_id);
    if (it == m_skills.end()) return std::nullopt;
    return it->second.back();
}

void InMemoryRepository::append_execution_record(const runtime::ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_executions.push_back(record);
}

std::vector<runtime::ExecutionRecord> InMemoryRepository::list_execution_records() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_executions;
}

std::optional<bench::Dataset> InMemoryRepository::load_dataset(const std::string& dataset_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto& d : m_datasets) {
        if (d.id == dataset_id) return d;
    }
    return std::nullopt;
}

void InMemoryRepository::update_dataset(const bench::Dataset& dataset) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_dataset_locked(dataset);
}

std::vector<bench::Case> InMemoryRepository::load_cases(const std::string& dataset_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::vector<bench::Case> out;
    for (const auto& c : m_cases) {
        if (c.dataset_id == dataset_id) out.push_back(c);
    }
    return out;
}

void InMemoryRepository::append_cases(const std::vector<bench::Case>& cases) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_cases.insert(m_cases.end(), cases.begin(), cases.end());
}

void InMemoryRepository::save_run(const bench::Run& run) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_run_locked(run);
}

std::optional<bench::Run> InMemoryRepository::get_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto& r : m_runs) {
        if (r.id == run_id) return r;
    }
    return std::nullopt;
}

long long InMemoryRepository::append_benchmark_result(const bench::Result& result) {
    std::lock_guard<std::mutex> lock(m_mu);
    bench::Result stored = result;
    stored.id = m_next_result_id++;
    m_results.push_back(std::move(stored));
    return m_results.back().id;
}

std::vector<bench::Result> InMemoryRepository::list_results(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::vector<bench::Result> out;
    for (const auto& r : m_results) {
        if (r.run_id == run_id) out.push_back(r);
    }
    return out;
}

std::optional<bench::GenerationTemplate> InMemoryRepository::get_template(const std::string& template_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto& t : m_templates) {
        if (t.id == template_id) return t;
    }
    return std::nullopt;
}

skill::Skill InMemoryRepository::publish_skill(skill::Skill s) {
    std::lock_guard<std::mutex> lock(m_mu);
    return publish_locked(std::move(s));
}

void InMemoryRepository::set_skill_status(const std::string& skill_id, skill::SkillStatus status) {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_skills.find(skill_id);
    if (it == m_skills.end()) throw common::NotFoundError("skill", skill_id);
    it->second.back().status = status;
}

std::vector<skill::Skill> InMemoryRepository::skill_versions(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_skills.find(skill_id);
    if (it == m_skills.end()) return {};
    return it->second;
}

void InMemoryRepository::quarantine(const std::string& source, const std::string& reason) {
    logging::warn("SkillRepository", "quarantined " + source + ": " + reason);
    std::lock_guard<std::mutex> lock(m_mu);
    m_quarantined.push_back({source, reason});
}

std::vector<QuarantinedSkill> InMemoryRepository::quarantined() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_quarantined;
}

void InMemoryRepository::put_template(const bench::GenerationTemplate& t) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_template_locked(t);
}

skill::Skill InMemoryRepository::publish_locked(skill::Skill s) {
    if (s.skill_id.empty()) throw std::runtime_error("cannot publish a skill without skill_id");
    if (!s.dsl) throw std::runtime_error("cannot publish skill " + s.skill_id + " without a DSL payload");

    auto it = m_skills.find(s.skill_id);
    if (it == m_skills.end()) {
        m_skill_order.push_back(s.skill_id);
        m_skills[s.skill_id].push_back(s);
        return s;
    }

    skill::Skill& latest = it->second.back();
    if (skill::skill_dsl_to_json(*latest.dsl) == skill::skill_dsl_to_json(*s.dsl)) {
        latest.skill_name = s.skill_name;
        latest.domain = s.domain;
        latest.priority = s.priority;
        latest.status = s.status;
        return latest;
    }

    s.dsl_version = skill::next_minor_version(latest.dsl_version);
    it->second.push_back(s);
    return s;
}

void InMemoryRepository::upsert_dataset_locked(const bench::Dataset& dataset) {
    for (auto& d : m_datasets) {
        if (d.id == dataset.id) {
            d = dataset;
            return;
        }
    }
    m_datasets.push_back(dataset);
}

void InMemoryRepository::upsert_run_locked(const bench::Run& run) {
    for (auto& r : m_runs) {
        if (r.id == run.id) {
            r = run;
            return;
        }
    }
    m_runs.push_back(run);
}

void InMemoryRepository::upsert_template_locked(const bench::GenerationTemplate& t) {
    for (auto& existing : m_templates) {
        if (existing.id == t.id) {
            existing = t;
            return;
        }
    }
    m_templates.push_back(t);
}

}  // namespace store
