#include "store/JsonDirRepository.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Log.hpp"

namespace fs = std::filesystem;
using json = common::json;

namespace store {

static json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open " + path.string());
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path.string() + ": " + e.what());
    }
}

static void write_json(const fs::path& path, const json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to write " + path.string());
    out << j.dump(2) << "\n";
}

static void append_jsonl(const fs::path& path, const json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out) throw std::runtime_error("failed to append to " + path.string());
    out << j.dump() << "\n";
}

// calls fn(json, "file:line") for each non-blank line
template <typename Fn>
static void for_each_jsonl(const fs::path& path, Fn&& fn) {
    if (!fs::exists(path)) return;
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open " + path.string());

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::ostringstream where;
        where << path.filename().string() << ":" << line_no;
        json j;
        try {
            j = json::parse(line);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("invalid JSON at " + where.str() + ": " + e.what());
        }
        fn(j, where.str());
    }
}

template <typename T>
static std::vector<T> read_array_file(const fs::path& path) {
    std::vector<T> out;
    if (!fs::exists(path)) return out;
    json j = read_json_file(path);
    if (!j.is_array()) throw std::runtime_error(path.string() + " must be a JSON array");
    for (const auto& item : j) out.push_back(T::from_json(item));
    return out;
}

template <typename T>
static json to_array(const std::vector<T>& items) {
    json arr = json::array();
    for (const auto& item : items) arr.push_back(item.to_json());
    return arr;
}

int compare_versions(const std::string& a, const std::string& b) {
    std::istringstream sa(a), sb(b);
    std::string pa, pb;
    while (true) {
        const bool ha = static_cast<bool>(std::getline(sa, pa, '.'));
        const bool hb = static_cast<bool>(std::getline(sb, pb, '.'));
        if (!ha && !hb) return 0;
        const long na = ha ? std::strtol(pa.c_str(), nullptr, 10) : 0;
        const long nb = hb ? std::strtol(pb.c_str(), nullptr, 10) : 0;
        if (na != nb) return na < nb ? -1 : 1;
    }
}

JsonDirRepository::JsonDirRepository(fs::path root) : m_root(std::move(root)) {
    fs::create_directories(m_root / "skills");
    load_all();
}

void JsonDirRepository::load_all() {
    load_skills();

    std::lock_guard<std::mutex> lock(m_mu);
    m_datasets = read_array_file<bench::Dataset>(m_root / "datasets.json");
    m_runs = read_array_file<bench::Run>(m_root / "runs.json");
    m_templates = read_array_file<bench::GenerationTemplate>(m_root / "templates.json");

    for_each_jsonl(m_root / "cases.jsonl", [&](const json& j, const std::string&) {
        m_cases.push_back(bench::Case::from_json(j));
    });
    for_each_jsonl(m_root / "results.jsonl", [&](const json& j, const std::string&) {
        m_results.push_back(bench::Result::from_json(j));
        m_next_result_id = std::max(m_next_result_id, m_results.back().id + 1);
    });
    for_each_jsonl(m_root / "executions.jsonl", [&](const json& j, const std::string&) {
        m_executions.push_back(runtime::ExecutionRecord::from_json(j));
    });
}

void JsonDirRepository::load_skills() {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(m_root / "skills")) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    std::vector<skill::Skill> loaded;
    for (const auto& path : files) {
        try {
            loaded.push_back(skill::skill_from_json(read_json_file(path)));
        } catch (const json::exception& e) {
            quarantine(path.filename().string(), e.what());
        } catch (const std::runtime_error& e) {
            quarantine(path.filename().string(), e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_mu);
    for (auto& s : loaded) {
        auto& versions = m_skills[s.skill_id];
        if (versions.empty()) m_skill_order.push_back(s.skill_id);
        versions.push_back(std::move(s));
    }
    for (auto& [id, versions] : m_skills) {
        std::stable_sort(versions.begin(), versions.end(), [](const skill::Skill& a, const skill::Skill& b) {
            return compare_versions(a.dsl_version, b.dsl_version) < 0;
        });
    }

    logging::info("SkillRepository", "loaded " + std::to_string(m_skill_order.size()) + " skill(s) from " +
                                          (m_root / "skills").string());
}

void JsonDirRepository::write_skill_file(const skill::Skill& s) const {
    write_json(m_root / "skills" / (s.skill_id + "@" + s.dsl_version + ".json"), skill::skill_to_json(s));
}

void JsonDirRepository::write_datasets_locked() const {
    write_json(m_root / "datasets.json", to_array(m_datasets));
}

void JsonDirRepository::write_runs_locked() const {
    write_json(m_root / "runs.json", to_array(m_runs));
}

void JsonDirRepository::write_templates_locked() const {
    write_json(m_root / "templates.json", to_array(m_templates));
}

void JsonDirRepository::append_execution_record(const runtime::ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mu);
    append_jsonl(m_root / "executions.jsonl", record.to_json());
    m_executions.push_back(record);
}

void JsonDirRepository::update_dataset(const bench::Dataset& dataset) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_dataset_locked(dataset);
    write_datasets_locked();
}

void JsonDirRepository::append_cases(const std::vector<bench::Case>& cases) {
    std::lock_guard<std::mutex> lock(m_mu);
    for (const auto& c : cases) {
        append_jsonl(m_root / "cases.jsonl", c.to_json());
        m_cases.push_back(c);
    }
}

void JsonDirRepository::save_run(const bench::Run& run) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_run_locked(run);
    write_runs_locked();
}

long long JsonDirRepository::append_benchmark_result(const bench::Result& result) {
    std::lock_guard<std::mutex> lock(m_mu);
    bench::Result stored = result;
    stored.id = m_next_result_id++;
    append_jsonl(m_root / "results.jsonl", stored.to_json());
    m_results.push_back(std::move(stored));
    return m_results.back().id;
}

skill::Skill JsonDirRepository::publish_skill(skill::Skill s) {
    std::lock_guard<std::mutex> lock(m_mu);
    skill::Skill stored = publish_locked(std::move(s));
    write_skill_file(stored);
    return stored;
}

void JsonDirRepository::set_skill_status(const std::string& skill_id, skill::SkillStatus status) {
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_skills.find(skill_id);
    if (it == m_skills.end()) throw common::NotFoundError("skill", skill_id);
    it->second.back().status = status;
    write_skill_file(it->second.back());
}

void JsonDirRepository::put_template(const bench::GenerationTemplate& t) {
    std::lock_guard<std::mutex> lock(m_mu);
    upsert_template_locked(t);
    write_templates_locked();
}

}  // namespace store
