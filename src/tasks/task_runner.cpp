#include <cstdio>
#include <exception>
#include <functional>

#include "./task_runner.hpp"

static void run_task(const std::shared_ptr<Task> &task, const std::function<void()> &on_done) {
    try {
        task->run();
    } catch (const std::exception &e) {
        fprintf(stderr, "[%s] Task stopped with an exception: %s\n", task_kind_name(task->kind()), e.what());
    }
    on_done();
}

TaskRunner::~TaskRunner() {
    shutdown();
}

bool TaskRunner::is_done(const slot_t &slot) {
    std::lock_guard<std::mutex> lock{ slot.completion->mutex };
    return slot.completion->done;
}

void TaskRunner::reap(task_kind_t kind) {
    const auto it = slots.find(kind);
    if (it == slots.end()) {
        return;
    }
    if (it->second.thread.joinable()) {
        it->second.thread.join();
    }
    slots.erase(it);
}

std::optional<std::string> TaskRunner::submit(std::shared_ptr<Task> task) {
    if (task == nullptr) {
        return std::string("No task to run");
    }
    const auto kind = task->kind();
    if (is_active(kind)) {
        return std::string("A ") + task_kind_name(kind) + " is already running";
    }
    if (task->state() != task_state_t::Idle) {
        return std::string("Task has already been run");
    }
    reap(kind);

    auto completion = std::make_shared<completion_t>();
    slot_t slot { task, completion, std::thread() };
    slot.thread = std::thread([task, completion]() {
        run_task(task, [&completion]() {
            {
                std::lock_guard<std::mutex> lock{ completion->mutex };
                completion->done = true;
            }
            completion->condition.notify_all();
        });
    });
    slots.emplace(kind, std::move(slot));
    return std::nullopt;
}

bool TaskRunner::is_active(task_kind_t kind) const {
    const auto it = slots.find(kind);
    if (it == slots.end()) {
        return false;
    }
    return !is_done(it->second);
}

bool TaskRunner::has_active() const {
    for (const auto &s : slots) {
        if (!is_done(s.second)) {
            return true;
        }
    }
    return false;
}

void TaskRunner::cancel_all() {
    for (auto &s : slots) {
        s.second.task->cancel();
    }
}

bool TaskRunner::wait(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool all_done = true;
    for (auto &s : slots) {
        auto &completion = *s.second.completion;
        std::unique_lock<std::mutex> lock{ completion.mutex };
        if (!completion.condition.wait_until(lock, deadline, [&completion] { return completion.done; })) {
            all_done = false;
        }
    }
    return all_done;
}

bool TaskRunner::shutdown(std::chrono::milliseconds timeout) {
    cancel_all();
    const auto all_done = wait(timeout);
    for (auto &s : slots) {
        if (!s.second.thread.joinable()) {
            continue;
        }
        if (is_done(s.second)) {
            s.second.thread.join();
            continue;
        }
        fprintf(stderr, "[%s] Task did not stop in time, abandoning it\n", task_kind_name(s.first));
        s.second.thread.detach();
    }
    slots.clear();
    return all_done;
}
