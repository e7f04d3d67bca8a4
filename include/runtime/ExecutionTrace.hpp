#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Clock.hpp"
#include "common/Json.hpp"
#include "runtime/Models.hpp"

namespace runtime {

// Stage names, in pipeline order.
inline constexpr const char* kStageIntentMatching = "IntentMatching";
inline constexpr const char* kStageExtract = "ExtractEngine";
inline constexpr const char* kStageTable = "TableEngine";
inline constexpr const char* kStageRule = "RuleEngine";
inline constexpr const char* kStageCategory = "CategoryEngine";
inline constexpr const char* kStageStruct = "StructBuilder";

// Stage slots reserved by each tracer, one per stage above.
inline constexpr size_t kStageCapacity = 6;

struct StageTrace {
    std::string engine;
    common::TimePoint started_at{};
    common::TimePoint ended_at{};
    long long duration_ms = 0;
    common::json input_snapshot = common::json::object();
    common::json output_snapshot = common::json::object();
    bool succeeded = true;

    common::json to_json() const;
    static StageTrace from_json(const common::json& j);
};

enum class ExecutionOutcome {
    Success,
    Failed
};

const char* to_string(ExecutionOutcome o);

// One execution, created when the run starts and persisted once at the end.
struct ExecutionRecord {
    std::string correlation_id;
    std::string input_text;
    std::optional<std::string> matched_skill_id;
    std::vector<StageTrace> stages;
    std::optional<MaterialResult> result;
    std::optional<double> aggregate_confidence;
    long long duration_ms = 0;
    ExecutionOutcome outcome = ExecutionOutcome::Success;
    std::optional<std::string> error_detail;
    common::TimePoint created_at{};

    common::json to_json() const;
    static ExecutionRecord from_json(const common::json& j);
};

class ExecutionTracer;

// Times one stage. The stage is appended when the scope ends, also when it
// ends by an exception (then it is marked failed).
class StageScope {
public:
    StageScope(ExecutionTracer& tracer, std::string engine, common::json input);
    ~StageScope();

    StageScope(const StageScope&) = delete;
    StageScope& operator=(const StageScope&) = delete;

    void set_input(common::json input) { m_stage.input_snapshot = std::move(input); }
    void set_output(common::json output) { m_stage.output_snapshot = std::move(output); }

private:
    ExecutionTracer& m_tracer;
    StageTrace m_stage;
    int m_uncaught = 0;
};

class ExecutionTracer {
public:
    ExecutionTracer(std::string correlation_id, std::string input_text);

    const std::string& correlation_id() const { return m_record.correlation_id; }
    const std::vector<StageTrace>& stages() const { return m_record.stages; }
    bool finished() const { return m_finished; }
    int dropped_stages() const { return m_dropped_stages; }

    void set_matched_skill(const std::string& skill_id) { m_record.matched_skill_id = skill_id; }

    // Both finish_* hand the record over; the tracer is spent afterwards.
    ExecutionRecord finish_success(const MaterialResult& result);
    ExecutionRecord finish_failure(const std::string& error_detail);

private:
    friend class StageScope;
    // Never allocates: false once the reserved slots are used up.
    bool append_stage(StageTrace&& stage) noexcept;
    void close();

    ExecutionRecord m_record;
    common::TimePoint m_started;
    bool m_finished = false;
    int m_dropped_stages = 0;
};

}  // namespace runtime
