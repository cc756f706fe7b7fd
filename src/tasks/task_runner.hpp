#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "./task.hpp"

#define DEFAULT_SHUTDOWN_TIMEOUT std::chrono::milliseconds(3000)

// Runs each submitted task on its own thread. At most one task per kind is
// active; the runner never interrupts a task, it only requests cancellation.
// NOTE: TaskRunner methods must be called from a single owner thread

class TaskRunner {
public:
    TaskRunner() = default;
    TaskRunner(const TaskRunner &) = delete;
    TaskRunner &operator=(const TaskRunner &) = delete;
    // shuts down with the default timeout
    ~TaskRunner();

    // returns an error if a task of the same kind is still running
    std::optional<std::string> submit(std::shared_ptr<Task> task);

    bool is_active(task_kind_t kind) const;
    bool has_active() const;

    void cancel_all();

    // true if every task reached a terminal state within timeout
    bool wait(std::chrono::milliseconds timeout);

    // cancel, wait, and abandon threads that did not finish in time
    bool shutdown(std::chrono::milliseconds timeout = DEFAULT_SHUTDOWN_TIMEOUT);

private:
    // shared with the worker thread so an abandoned thread never touches the runner
    struct completion_t {
        std::mutex mutex;
        std::condition_variable condition;
        bool done = false;
    };

    struct slot_t {
        std::shared_ptr<Task> task;
        std::shared_ptr<completion_t> completion;
        std::thread thread;
    };

    static bool is_done(const slot_t &slot);
    void reap(task_kind_t kind);

    std::map<task_kind_t, slot_t> slots;
};
