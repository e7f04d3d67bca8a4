#pragma once

#include <stdexcept>
#include <string>

namespace common {

// Structural problem in a Skill DSL payload. Carries the JSON path in the message.
class DslError : public std::runtime_error {
public:
    explicit DslError(const std::string& msg) : std::runtime_error(msg) {}
};

// Unknown skill / dataset / run / template id.
class NotFoundError : public std::runtime_error {
public:
    NotFoundError(const std::string& what_kind, const std::string& id)
        : std::runtime_error(what_kind + " not found: " + id), m_kind(what_kind), m_id(id) {}

    const std::string& kind() const { return m_kind; }
    const std::string& id() const { return m_id; }

private:
    std::string m_kind;
    std::string m_id;
};

class RunAlreadyInProgress : public std::runtime_error {
public:
    explicit RunAlreadyInProgress(const std::string& run_id)
        : std::runtime_error("run is already in progress: " + run_id) {}
};

class DatasetEmpty : public std::runtime_error {
public:
    explicit DatasetEmpty(const std::string& dataset_id)
        : std::runtime_error("dataset has no active cases: " + dataset_id) {}
};

class RunNotCompleted : public std::runtime_error {
public:
    explicit RunNotCompleted(const std::string& run_id)
        : std::runtime_error("run has not completed: " + run_id) {}
};

}  // namespace common
