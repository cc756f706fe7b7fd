#pragma once

#include <atomic>

enum class task_state_t {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

enum class task_kind_t {
    Scan,
    Archive
};

const char *task_state_name(task_state_t state);
const char *task_kind_name(task_kind_t kind);
bool is_terminal(task_state_t state);

// One run of a scan or an archive. Instances are single-use: run() is called
// once on a worker thread, cancel() may be called from any thread.
class Task {
public:
    virtual ~Task() = default;

    virtual void run() = 0;
    virtual task_kind_t kind() const = 0;

    // cooperative, honoured at the next page or file boundary
    void cancel();
    bool is_cancelled() const;
    task_state_t state() const;

protected:
    void set_state(task_state_t state);

private:
    std::atomic<bool> cancelled {false};
    std::atomic<task_state_t> current_state {task_state_t::Idle};
};
