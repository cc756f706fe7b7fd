#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <gtest/gtest.h>

#include "../src/tasks/task_runner.hpp"

struct gate_t {
    std::mutex mutex;
    std::condition_variable condition;
    bool open = false;
};

// Blocks until the gate opens. Honours cancellation unless told not to.
class GateTask : public Task {
public:
    GateTask(task_kind_t kind_, std::shared_ptr<gate_t> gate_, bool honour_cancel_ = true) :
        task_kind {kind_}, gate {gate_}, honour_cancel {honour_cancel_} {}

    void run() override {
        set_state(task_state_t::Running);
        std::unique_lock<std::mutex> lock{ gate->mutex };
        while (!gate->open) {
            if (honour_cancel && is_cancelled()) {
                set_state(task_state_t::Cancelled);
                return;
            }
            gate->condition.wait_for(lock, std::chrono::milliseconds(5));
        }
        set_state(task_state_t::Completed);
    }

    task_kind_t kind() const override {
        return task_kind;
    }

private:
    const task_kind_t task_kind;
    std::shared_ptr<gate_t> gate;
    const bool honour_cancel;
};

class ThrowingTask : public Task {
public:
    void run() override {
        throw std::runtime_error("boom");
    }

    task_kind_t kind() const override {
        return task_kind_t::Scan;
    }
};

static void open_gate(gate_t &gate) {
    {
        std::lock_guard<std::mutex> lock{ gate.mutex };
        gate.open = true;
    }
    gate.condition.notify_all();
}

TEST(task_runner_test, runs_to_completion) {
    auto gate = std::make_shared<gate_t>();
    auto task = std::make_shared<GateTask>(task_kind_t::Scan, gate);
    TaskRunner runner;
    EXPECT_EQ(runner.submit(task), std::nullopt);
    EXPECT_TRUE(runner.is_active(task_kind_t::Scan));
    EXPECT_FALSE(runner.is_active(task_kind_t::Archive));
    open_gate(*gate);
    EXPECT_TRUE(runner.wait(std::chrono::seconds(5)));
    EXPECT_EQ(task->state(), task_state_t::Completed);
    EXPECT_FALSE(runner.has_active());
}

TEST(task_runner_test, one_task_per_kind) {
    auto gate = std::make_shared<gate_t>();
    TaskRunner runner;
    EXPECT_EQ(runner.submit(std::make_shared<GateTask>(task_kind_t::Scan, gate)), std::nullopt);
    const auto second = runner.submit(std::make_shared<GateTask>(task_kind_t::Scan, gate));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), "A scan is already running");
    // a different kind may run alongside
    EXPECT_EQ(runner.submit(std::make_shared<GateTask>(task_kind_t::Archive, gate)), std::nullopt);
    open_gate(*gate);
    EXPECT_TRUE(runner.wait(std::chrono::seconds(5)));
    // the slot is free again
    EXPECT_EQ(runner.submit(std::make_shared<GateTask>(task_kind_t::Scan, gate)), std::nullopt);
    EXPECT_TRUE(runner.wait(std::chrono::seconds(5)));
}

TEST(task_runner_test, tasks_are_single_use) {
    auto gate = std::make_shared<gate_t>();
    open_gate(*gate);
    auto task = std::make_shared<GateTask>(task_kind_t::Archive, gate);
    TaskRunner runner;
    EXPECT_EQ(runner.submit(task), std::nullopt);
    EXPECT_TRUE(runner.wait(std::chrono::seconds(5)));
    EXPECT_EQ(runner.submit(task), "Task has already been run");
}

TEST(task_runner_test, shutdown_cancels) {
    auto gate = std::make_shared<gate_t>();
    auto task = std::make_shared<GateTask>(task_kind_t::Archive, gate);
    TaskRunner runner;
    EXPECT_EQ(runner.submit(task), std::nullopt);
    EXPECT_TRUE(runner.shutdown(std::chrono::seconds(5)));
    EXPECT_EQ(task->state(), task_state_t::Cancelled);
    EXPECT_FALSE(runner.has_active());
}

TEST(task_runner_test, shutdown_abandons_stuck_task) {
    auto gate = std::make_shared<gate_t>();
    auto task = std::make_shared<GateTask>(task_kind_t::Scan, gate, false);
    {
        TaskRunner runner;
        EXPECT_EQ(runner.submit(task), std::nullopt);
        const auto started = std::chrono::steady_clock::now();
        EXPECT_FALSE(runner.shutdown(std::chrono::milliseconds(50)));
        EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
        EXPECT_FALSE(runner.has_active());
    }
    EXPECT_TRUE(task->is_cancelled());
    // the abandoned thread still owns the task and finishes on its own
    open_gate(*gate);
}

TEST(task_runner_test, exception_does_not_escape) {
    TaskRunner runner;
    EXPECT_EQ(runner.submit(std::make_shared<ThrowingTask>()), std::nullopt);
    EXPECT_TRUE(runner.wait(std::chrono::seconds(5)));
    EXPECT_FALSE(runner.is_active(task_kind_t::Scan));
}

TEST(task_runner_test, state_names) {
    EXPECT_STREQ(task_state_name(task_state_t::Cancelled), "Cancelled");
    EXPECT_STREQ(task_kind_name(task_kind_t::Archive), "archive");
    EXPECT_TRUE(is_terminal(task_state_t::Failed));
    EXPECT_FALSE(is_terminal(task_state_t::Running));
}
