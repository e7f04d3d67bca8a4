#include "runtime/ExecutionTrace.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

using json = common::json;

namespace runtime {

static long long elapsed_ms(common::TimePoint from, common::TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

const char* to_string(ExecutionOutcome o) {
    return o == ExecutionOutcome::Success ? "success" : "failed";
}

json StageTrace::to_json() const {
    return {
        {"engine", engine},
        {"started_at", common::to_epoch_ms(started_at)},
        {"ended_at", common::to_epoch_ms(ended_at)},
        {"duration_ms", duration_ms},
        {"status", succeeded ? "success" : "failed"},
        {"input", input_snapshot},
        {"output", output_snapshot}
    };
}

StageTrace StageTrace::from_json(const json& j) {
    StageTrace s;
    s.engine = j.value("engine", "");
    s.started_at = common::from_epoch_ms(j.value("started_at", 0LL));
    s.ended_at = common::from_epoch_ms(j.value("ended_at", 0LL));
    s.duration_ms = j.value("duration_ms", 0LL);
    s.succeeded = j.value("status", "success") == "success";
    if (j.contains("input")) s.input_snapshot = j.at("input");
    if (j.contains("output")) s.output_snapshot = j.at("output");
    return s;
}

json ExecutionRecord::to_json() const {
    json j = json::object();
    j["trace_id"] = correlation_id;
    j["input_text"] = input_text;
    j["matched_skill_id"] = matched_skill_id ? json(*matched_skill_id) : json(nullptr);
    j["outcome"] = to_string(outcome);
    j["confidence"] = aggregate_confidence ? json(*aggregate_confidence) : json(nullptr);
    j["duration_ms"] = duration_ms;
    j["error"] = error_detail ? json(*error_detail) : json(nullptr);
    j["created_at"] = common::iso8601(created_at);
    j["created_at_ms"] = common::to_epoch_ms(created_at);

    json stages_j = json::array();
    for (const auto& s : stages) stages_j.push_back(s.to_json());
    j["stages"] = std::move(stages_j);

    j["result"] = result ? result->to_json() : json(nullptr);
    return j;
}

ExecutionRecord ExecutionRecord::from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("execution record must be an object");

    ExecutionRecord r;
    r.correlation_id = j.value("trace_id", "");
    r.input_text = j.value("input_text", "");
    if (j.contains("matched_skill_id") && j.at("matched_skill_id").is_string()) {
        r.matched_skill_id = j.at("matched_skill_id").get<std::string>();
    }
    r.outcome = j.value("outcome", "success") == "success" ? ExecutionOutcome::Success : ExecutionOutcome::Failed;
    if (j.contains("confidence") && j.at("confidence").is_number()) {
        r.aggregate_confidence = j.at("confidence").get<double>();
    }
    r.duration_ms = j.value("duration_ms", 0LL);
    if (j.contains("error") && j.at("error").is_string()) r.error_detail = j.at("error").get<std::string>();
    r.created_at = common::from_epoch_ms(j.value("created_at_ms", 0LL));

    if (j.contains("stages") && j.at("stages").is_array()) {
        for (const auto& s : j.at("stages")) r.stages.push_back(StageTrace::from_json(s));
    }
    if (j.contains("result") && j.at("result").is_object()) {
        r.result = MaterialResult::from_json(j.at("result"));
    }
    return r;
}

StageScope::StageScope(ExecutionTracer& tracer, std::string engine, json input)
    : m_tracer(tracer), m_uncaught(std::uncaught_exceptions()) {
    m_stage.engine = std::move(engine);
    m_stage.input_snapshot = std::move(input);
    m_stage.started_at = common::Clock::now();
}

StageScope::~StageScope() {
    m_stage.ended_at = common::Clock::now();
    m_stage.duration_ms = elapsed_ms(m_stage.started_at, m_stage.ended_at);
    m_stage.succeeded = std::uncaught_exceptions() == m_uncaught;
    if (!m_tracer.append_stage(std::move(m_stage))) ++m_tracer.m_dropped_stages;
}

ExecutionTracer::ExecutionTracer(std::string correlation_id, std::string input_text)
    : m_started(common::Clock::now()) {
    m_record.correlation_id = std::move(correlation_id);
    m_record.input_text = std::move(input_text);
    m_record.created_at = m_started;
    m_record.stages.reserve(kStageCapacity);
}

bool ExecutionTracer::append_stage(StageTrace&& stage) noexcept {
    if (m_record.stages.size() >= kStageCapacity) return false;
    m_record.stages.push_back(std::move(stage));
    return true;
}

void ExecutionTracer::close() {
    if (m_finished) throw std::logic_error("execution trace already finished: " + m_record.correlation_id);
    m_finished = true;
    m_record.duration_ms = elapsed_ms(m_started, common::Clock::now());
}

ExecutionRecord ExecutionTracer::finish_success(const MaterialResult& result) {
    close();
    m_record.outcome = ExecutionOutcome::Success;
    m_record.result = result;
    m_record.aggregate_confidence = result.confidence_score;
    return std::move(m_record);
}

ExecutionRecord ExecutionTracer::finish_failure(const std::string& error_detail) {
    close();
    m_record.outcome = ExecutionOutcome::Failed;
    m_record.error_detail = error_detail;
    return std::move(m_record);
}

}  // namespace runtime
