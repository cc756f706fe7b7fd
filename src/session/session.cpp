#include <algorithm>
#include <cstdio>

#include "../archive/archive_task.hpp"
#include "../scan/scan_task.hpp"
#include "./session.hpp"

#define PUMP_POLL_INTERVAL std::chrono::milliseconds(20)

ArchiveSession::ArchiveSession(
    const app_config_t &config_,
    std::shared_ptr<RemoteFileSource> source_,
    std::shared_ptr<LocalStore> store_,
    std::shared_ptr<ArchiveJournal> journal_) :
    settings {config_},
    source {source_},
    store {store_},
    journal {journal_},
    scan_events {std::make_shared<ScanEventQueue>()},
    archive_events {std::make_shared<ArchiveEventQueue>()},
    scan_results {} {}

std::optional<std::string> ArchiveSession::start_scan() {
    if (runner.is_active(task_kind_t::Scan)) {
        return std::string("A scan is already running");
    }
    auto task = std::make_shared<ScanTask>(source, scan_events, make_rule_set(settings));
    return runner.submit(task);
}

std::optional<std::string> ArchiveSession::preflight(const std::vector<remote_file_t> &files) const {
    const auto root_ret = validate_archive_root(settings.archive_path);
    if (root_ret.has_value()) {
        return root_ret;
    }
    unsigned long long required = 0;
    for (const auto &f : files) {
        if (!is_virtual_document(f.mime_type)) {
            required += f.size;
        }
    }
    const auto space_ret = store->free_space(std::filesystem::u8path(settings.archive_path));
    if (std::holds_alternative<std::string>(space_ret)) {
        return std::string("Could not check free space: ") + std::get<std::string>(space_ret);
    }
    const auto available = std::get<unsigned long long>(space_ret);
    if (available < required) {
        return std::string("Not enough free space: need ") + format_size(required) + ", available " + format_size(available);
    }
    return std::nullopt;
}

std::optional<std::string> ArchiveSession::start_archive(const std::vector<remote_file_t> &files) {
    if (runner.is_active(task_kind_t::Archive)) {
        return std::string("An archive is already running");
    }
    if (settings.archive_path.empty()) {
        return std::string("Archive location is not set");
    }
    const auto dry_run = settings.rules.dry_run;
    if (!dry_run) {
        const auto preflight_ret = preflight(files);
        if (preflight_ret.has_value()) {
            return preflight_ret;
        }
    }
    archive_options_t options { dry_run, settings.rules.trash_after };
    auto task = std::make_shared<ArchiveTask>(
        source,
        store,
        archive_events,
        files,
        std::filesystem::u8path(settings.archive_path),
        options,
        journal);
    return runner.submit(task);
}

void ArchiveSession::cancel() {
    runner.cancel_all();
}

void ArchiveSession::dispatch(const session_handlers_t &handlers, const ScanEvent &event) {
    if (std::holds_alternative<ScanProgress>(event)) {
        if (handlers.on_scan_progress) {
            handlers.on_scan_progress(std::get<ScanProgress>(event).count);
        }
        return;
    }
    if (std::holds_alternative<TaskStatus>(event)) {
        if (handlers.on_status) {
            handlers.on_status(task_kind_t::Scan, std::get<TaskStatus>(event).text);
        }
        return;
    }
    if (std::holds_alternative<ScanCompleted>(event)) {
        const auto &completed = std::get<ScanCompleted>(event);
        scan_results = completed.files;
        if (handlers.on_scan_completed) {
            handlers.on_scan_completed(completed.files, completed.total_bytes);
        }
        return;
    }
    if (std::holds_alternative<ScanCancelled>(event)) {
        if (handlers.on_scan_cancelled) {
            handlers.on_scan_cancelled();
        }
        return;
    }
    if (handlers.on_error) {
        handlers.on_error(task_kind_t::Scan, std::get<TaskError>(event).message);
    }
}

void ArchiveSession::dispatch(const session_handlers_t &handlers, const ArchiveEvent &event) {
    if (std::holds_alternative<ArchiveProgress>(event)) {
        const auto &progress = std::get<ArchiveProgress>(event);
        if (handlers.on_archive_progress) {
            handlers.on_archive_progress(progress.current, progress.total, progress.name);
        }
        return;
    }
    if (std::holds_alternative<FileProgress>(event)) {
        const auto &progress = std::get<FileProgress>(event);
        if (handlers.on_file_progress) {
            handlers.on_file_progress(progress.bytes, progress.total);
        }
        return;
    }
    if (std::holds_alternative<FileResult>(event)) {
        if (handlers.on_file_result) {
            handlers.on_file_result(std::get<FileResult>(event).outcome);
        }
        return;
    }
    if (std::holds_alternative<TaskStatus>(event)) {
        if (handlers.on_status) {
            handlers.on_status(task_kind_t::Archive, std::get<TaskStatus>(event).text);
        }
        return;
    }
    if (std::holds_alternative<ArchiveCompleted>(event)) {
        if (handlers.on_archive_completed) {
            handlers.on_archive_completed(std::get<ArchiveCompleted>(event).result);
        }
        return;
    }
    if (handlers.on_error) {
        handlers.on_error(task_kind_t::Archive, std::get<TaskError>(event).message);
    }
}

size_t ArchiveSession::drain(const session_handlers_t &handlers) {
    size_t count = 0;
    while (true) {
        auto scan_event = scan_events->try_pop_front();
        if (!scan_event.has_value()) {
            break;
        }
        dispatch(handlers, scan_event.value());
        count++;
    }
    while (true) {
        auto archive_event = archive_events->try_pop_front();
        if (!archive_event.has_value()) {
            break;
        }
        dispatch(handlers, archive_event.value());
        count++;
    }
    return count;
}

size_t ArchiveSession::pump(const session_handlers_t &handlers, std::chrono::milliseconds wait) {
    auto count = drain(handlers);
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (count == 0 && std::chrono::steady_clock::now() < deadline) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        auto archive_event = archive_events->pop_front_waiting_for(std::min(remaining, PUMP_POLL_INTERVAL));
        if (archive_event.has_value()) {
            dispatch(handlers, archive_event.value());
            count++;
        }
        count += drain(handlers);
    }
    return count;
}

bool ArchiveSession::busy() const {
    return runner.has_active();
}

bool ArchiveSession::shutdown(std::chrono::milliseconds timeout) {
    return runner.shutdown(timeout);
}

const std::vector<remote_file_t> &ArchiveSession::last_scan() const {
    return scan_results;
}

const app_config_t &ArchiveSession::config() const {
    return settings;
}
