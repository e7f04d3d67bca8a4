#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Json.hpp"
#include "runtime/ExecutionTrace.hpp"
#include "runtime/Models.hpp"
#include "runtime/TableEngine.hpp"
#include "store/SkillRepository.hpp"

namespace runtime {

struct ParseResponse {
    std::string trace_id;
    std::optional<std::string> matched_skill_id;
    MaterialResult result;
    ExecutionRecord trace;

    common::json to_json() const;
};

// Single-case entry point. The benchmark harness only depends on this.
class MaterialParser {
public:
    virtual ~MaterialParser() = default;
    virtual ParseResponse execute(const std::string& input_text, const std::string& trace_id) = 0;
};

struct BatchItem {
    std::string input_text;
    std::optional<ParseResponse> response;  // nullopt when the execution failed
    std::string error;
};

struct ExecutionStats {
    int total = 0;
    int success = 0;
    double success_rate = 0.0;
    double avg_confidence = 0.0;     // 3 decimals
    double avg_duration_ms = 0.0;    // 2 decimals

    common::json to_json() const;
};

// "TRC_" + 16 hex chars
std::string new_trace_id();

// Stateless pipeline over the repository: every call re-reads the skills, so
// concurrent executions never share mutable state.
class SkillRuntime final : public MaterialParser {
public:
    explicit SkillRuntime(store::SkillRepository& repo, TableEngineConfig table_cfg = TableEngineConfig{});

    // Always persists one execution record. On an unexpected failure the
    // record is marked failed and the exception is rethrown.
    ParseResponse execute(const std::string& input_text, const std::string& trace_id) override;

    // One independent trace per input; failures become failed items.
    std::vector<BatchItem> execute_batch(const std::vector<std::string>& inputs);

    ExecutionStats stats() const;

private:
    store::SkillRepository& m_repo;
    TableEngineConfig m_table_cfg;

    MaterialResult run_skill(ExecutionTracer& tracer, const std::string& input_text, const skill::Skill& s) const;
};

}  // namespace runtime
