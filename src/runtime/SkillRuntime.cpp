#include "runtime/SkillRuntime.hpp"

#include <cmath>
#include <cstdio>
#include <random>

#include "common/Log.hpp"
#include "runtime/AttributeExtractor.hpp"
#include "runtime/RuleEngine.hpp"
#include "runtime/SkillSelector.hpp"
#include "runtime/StructBuilder.hpp"

using json = common::json;

namespace runtime {

json ParseResponse::to_json() const {
    return {
        {"trace_id", trace_id},
        {"matched_skill_id", matched_skill_id ? json(*matched_skill_id) : json(nullptr)},
        {"result", result.to_json()},
        {"execution_trace", trace.to_json()}
    };
}

json ExecutionStats::to_json() const {
    return {
        {"total_executions", total},
        {"success_count", success},
        {"success_rate", success_rate},
        {"avg_confidence", avg_confidence},
        {"avg_execution_time_ms", avg_duration_ms}
    };
}

std::string new_trace_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[24];
    std::snprintf(buf, sizeof(buf), "TRC_%016llx", static_cast<unsigned long long>(rng()));
    return buf;
}

static json attribute_snapshot(const AttributeSet& attrs) {
    return {{"attributes", attrs.to_json()}};
}

SkillRuntime::SkillRuntime(store::SkillRepository& repo, TableEngineConfig table_cfg)
    : m_repo(repo), m_table_cfg(std::move(table_cfg)) {}

ParseResponse SkillRuntime::execute(const std::string& input_text, const std::string& trace_id) {
    ExecutionTracer tracer(trace_id, input_text);

    try {
        SkillSelection sel;
        {
            std::vector<skill::Skill> skills = m_repo.list_skills();
            StageScope stage(tracer, kStageIntentMatching,
                             {{"input_text", input_text}, {"available_skills", skills.size()}});
            sel = select_skill(input_text, skills);
            stage.set_output(sel.to_json());
        }

        MaterialResult result;
        if (sel.skill) {
            tracer.set_matched_skill(sel.skill->skill_id);
            result = run_skill(tracer, input_text, *sel.skill);
        } else {
            result = default_result(input_text);
        }

        ParseResponse resp;
        resp.trace_id = trace_id;
        resp.matched_skill_id = sel.skill ? std::optional<std::string>(sel.skill->skill_id) : std::nullopt;
        resp.trace = tracer.finish_success(result);
        resp.result = std::move(result);
        m_repo.append_execution_record(resp.trace);
        return resp;
    } catch (const std::exception& e) {
        logging::warn("SkillRuntime", "execution " + trace_id + " failed: " + e.what());
        if (!tracer.finished()) m_repo.append_execution_record(tracer.finish_failure(e.what()));
        throw;
    }
}

MaterialResult SkillRuntime::run_skill(ExecutionTracer& tracer, const std::string& input_text,
                                       const skill::Skill& s) const {
    const skill::SkillDsl& dsl = *s.dsl;

    AttributeSet attrs;
    {
        StageScope stage(tracer, kStageExtract, {{"input_text", input_text}});
        attrs = extract_attributes(input_text, dsl);
        stage.set_output(attribute_snapshot(attrs));
    }
    {
        StageScope stage(tracer, kStageTable, json::object());
        TableDerivation d = derive_from_tables(attrs, dsl, m_table_cfg);
        stage.set_output(d.output_json());
        // the lookup keys are only known after coercion
        stage.set_input(d.input_json());
    }
    {
        StageScope stage(tracer, kStageRule, json::object());
        RuleOutcome r = apply_rules(attrs, dsl);
        stage.set_input(r.input_json());
        stage.set_output(r.output_json());
    }
    CategoryInfo category;
    {
        StageScope stage(tracer, kStageCategory, json::object());
        category = map_category(dsl);
        stage.set_output({{"category", category.to_json()}});
    }

    StageScope stage(tracer, kStageStruct, json::object());
    MaterialResult result = build_struct(input_text, std::move(attrs), std::move(category), dsl, m_table_cfg.names);
    stage.set_output({{"material_name", result.material_name}, {"confidence", result.confidence_score}});
    return result;
}

std::vector<BatchItem> SkillRuntime::execute_batch(const std::vector<std::string>& inputs) {
    std::vector<BatchItem> out;
    out.reserve(inputs.size());
    for (const auto& text : inputs) {
        BatchItem item;
        item.input_text = text;
        try {
            item.response = execute(text, new_trace_id());
        } catch (const std::exception& e) {
            item.error = e.what();
        }
        out.push_back(std::move(item));
    }
    return out;
}

ExecutionStats SkillRuntime::stats() const {
    const std::vector<ExecutionRecord> records = m_repo.list_execution_records();

    ExecutionStats st;
    st.total = static_cast<int>(records.size());

    double conf_sum = 0.0;
    int conf_n = 0;
    double dur_sum = 0.0;
    for (const auto& r : records) {
        if (r.outcome == ExecutionOutcome::Success) ++st.success;
        if (r.aggregate_confidence) {
            conf_sum += *r.aggregate_confidence;
            ++conf_n;
        }
        dur_sum += static_cast<double>(r.duration_ms);
    }

    if (st.total > 0) {
        st.success_rate = static_cast<double>(st.success) / st.total;
        st.avg_duration_ms = std::round(dur_sum / st.total * 100.0) / 100.0;
    }
    if (conf_n > 0) st.avg_confidence = std::round(conf_sum / conf_n * 1000.0) / 1000.0;
    return st;
}

}  // namespace runtime
