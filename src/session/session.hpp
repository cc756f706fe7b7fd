#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../config/config.hpp"
#include "../journal/journal.hpp"
#include "../local_store/local_store.hpp"
#include "../remote/remote_source.hpp"
#include "../tasks/events.hpp"
#include "../tasks/task_runner.hpp"

// Callbacks invoked by pump() on the caller's thread. Unset handlers are skipped.
struct session_handlers_t {
    std::function<void(size_t)> on_scan_progress;
    std::function<void(size_t, size_t, const std::string &)> on_archive_progress;
    std::function<void(unsigned long long, unsigned long long)> on_file_progress;
    std::function<void(const transfer_outcome_t &)> on_file_result;
    std::function<void(task_kind_t, const std::string &)> on_status;
    std::function<void(const std::vector<remote_file_t> &, unsigned long long)> on_scan_completed;
    std::function<void()> on_scan_cancelled;
    std::function<void(const aggregate_result_t &)> on_archive_completed;
    std::function<void(task_kind_t, const std::string &)> on_error;
};

// Owns the runner and the event queues of one caller. Tasks report only
// through the queues, so all callbacks run wherever pump() is called.
// NOTE: ArchiveSession is not thread-safe

class ArchiveSession {
public:
    ArchiveSession(
        const app_config_t &config_,
        std::shared_ptr<RemoteFileSource> source_,
        std::shared_ptr<LocalStore> store_,
        std::shared_ptr<ArchiveJournal> journal_ = nullptr);

    // optionally returns an error, e.g. when a scan is already running
    std::optional<std::string> start_scan();

    // optionally returns an error when the run is rejected before starting
    std::optional<std::string> start_archive(const std::vector<remote_file_t> &files);

    // checks a real run can write its files under the archive root
    std::optional<std::string> preflight(const std::vector<remote_file_t> &files) const;

    void cancel();

    // Dispatches queued events. When nothing is queued waits up to wait for
    // the first one. Returns the number of dispatched events.
    size_t pump(const session_handlers_t &handlers, std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    bool busy() const;
    bool shutdown(std::chrono::milliseconds timeout = DEFAULT_SHUTDOWN_TIMEOUT);

    // eligible files reported by the last completed scan
    const std::vector<remote_file_t> &last_scan() const;
    const app_config_t &config() const;

private:
    size_t drain(const session_handlers_t &handlers);
    void dispatch(const session_handlers_t &handlers, const ScanEvent &event);
    void dispatch(const session_handlers_t &handlers, const ArchiveEvent &event);

    const app_config_t settings;
    std::shared_ptr<RemoteFileSource> source;
    std::shared_ptr<LocalStore> store;
    std::shared_ptr<ArchiveJournal> journal;
    std::shared_ptr<ScanEventQueue> scan_events;
    std::shared_ptr<ArchiveEventQueue> archive_events;
    std::vector<remote_file_t> scan_results;
    TaskRunner runner;
};
