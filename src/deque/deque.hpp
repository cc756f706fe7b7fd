#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <condition_variable>

// Multi-producer / multi-consumer queue used as the event channel between
// worker threads and the thread that owns a task.
template<class T>
class ThreadSafeDeque {
  public:
    bool empty() const {
        std::lock_guard<std::mutex> lock{ mutex };
        return deque.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock{ mutex };
        return deque.size();
    }

    T pop_front_waiting() {
        // unique_lock can be unlocked, lock_guard can not
        std::unique_lock<std::mutex> lock{ mutex }; // locks
        while(deque.empty()) {
            condition.wait(lock); // unlocks, sleeps and relocks when woken up
        }
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    } // unlocks as goes out of scope

    // returns std::nullopt if nothing arrived before timeout
    template<class Rep, class Period>
    std::optional<T> pop_front_waiting_for(const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> lock{ mutex };
        if (!condition.wait_for(lock, timeout, [this] { return !deque.empty(); })) {
            return std::nullopt;
        }
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    }

    std::optional<T> try_pop_front() {
        std::lock_guard<std::mutex> lock{ mutex };
        if (deque.empty()) {
            return std::nullopt;
        }
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    }

    void push_back(T t) {
        std::unique_lock<std::mutex> lock{ mutex };
        deque.push_back(std::move(t));
        lock.unlock();
        condition.notify_one(); // wakes up pop_front_waiting
    }

    void clear() {
        std::lock_guard<std::mutex> lock{ mutex };
        deque.clear();
    }
  private:
    std::deque<T> deque;
    mutable std::mutex mutex;
    std::condition_variable condition;
};
