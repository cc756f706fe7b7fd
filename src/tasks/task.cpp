#include "./task.hpp"

const char *task_state_name(task_state_t state) {
    switch (state) {
    case task_state_t::Idle:
        return "Idle";
    case task_state_t::Running:
        return "Running";
    case task_state_t::Completed:
        return "Completed";
    case task_state_t::Cancelled:
        return "Cancelled";
    case task_state_t::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char *task_kind_name(task_kind_t kind) {
    return kind == task_kind_t::Scan ? "scan" : "archive";
}

bool is_terminal(task_state_t state) {
    return state == task_state_t::Completed || state == task_state_t::Cancelled || state == task_state_t::Failed;
}

void Task::cancel() {
    cancelled.store(true);
}

bool Task::is_cancelled() const {
    return cancelled.load();
}

task_state_t Task::state() const {
    return current_state.load();
}

void Task::set_state(task_state_t state) {
    current_state.store(state);
}
