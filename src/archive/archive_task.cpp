#include <cstdio>
#include <exception>

#include "../path/path_utils.hpp"
#include "./archive_task.hpp"

bool verify_transfer(const LocalStore &store, const std::filesystem::path &path, const std::optional<unsigned long long> &expected_size) {
    if (!store.exists(path)) {
        return false;
    }
    const auto size = store.file_size(path);
    if (!size.has_value() || size.value() == 0) {
        return false;
    }
    if (expected_size.has_value() && size.value() != expected_size.value()) {
        return false;
    }
    return true;
}

ArchiveTask::ArchiveTask(
    std::shared_ptr<RemoteFileSource> source_,
    std::shared_ptr<LocalStore> store_,
    std::shared_ptr<ArchiveEventQueue> events_,
    const std::vector<remote_file_t> &files_,
    const std::filesystem::path &archive_root_,
    const archive_options_t &options_,
    std::shared_ptr<ArchiveJournal> journal_) :
    source {source_},
    store {store_},
    events {events_},
    files {files_},
    archive_root {archive_root_},
    options {options_},
    journal {journal_} {}

task_kind_t ArchiveTask::kind() const {
    return task_kind_t::Archive;
}

aggregate_result_t ArchiveTask::result() const {
    return aggregate_result_t { success_count.load(), failure_count.load(), files.size(), state() };
}

void ArchiveTask::emit_status(const std::string &text) {
    fprintf(stdout, "[archive] %s\n", text.c_str());
    events->push_back(TaskStatus { text });
}

void ArchiveTask::fail(const std::string &message) {
    fprintf(stderr, "[archive] %s\n", message.c_str());
    set_state(task_state_t::Failed);
    events->push_back(TaskError { message });
}

void ArchiveTask::record(const transfer_outcome_t &outcome) {
    if (journal == nullptr) {
        return;
    }
    try {
        journal->record(outcome, options.dry_run);
    } catch (const std::exception &e) {
        fprintf(stderr, "[archive] Could not write journal entry for \"%s\": %s\n", outcome.name.c_str(), e.what());
    }
}

std::filesystem::path ArchiveTask::destination_for(const remote_file_t &file) {
    const auto clean_name = clean_file_name(file.name);
    std::optional<drive_date_t> modified_date;
    if (file.modified_time.has_value()) {
        modified_date = parse_drive_date(file.modified_time.value());
    }
    auto path = plan_local_path(archive_root, clean_name, file.mime_type, modified_date);
    // exports change the extension, so reserve the name they will actually get
    const auto export_format = export_format_for(file.mime_type);
    if (export_format.has_value()) {
        path = replace_extension(path, export_format->extension);
    }
    const auto destination = unique_path(path, [this](const std::filesystem::path &p) {
        return reserved.count(p) > 0 || store->exists(p);
    });
    reserved.insert(destination);
    return destination;
}

transfer_outcome_t ArchiveTask::process_file(const remote_file_t &file) {
    transfer_outcome_t outcome { file.id, file.name, false, "", std::nullopt };
    const auto destination = destination_for(file);

    if (options.dry_run) {
        outcome.success = true;
        outcome.detail = std::string(options.trash_after ? "Would download and trash" : "Would download") + " to " + destination.u8string();
        outcome.local_path = destination;
        return outcome;
    }

    const auto dir_ret = store->ensure_dir(destination.parent_path());
    if (dir_ret.has_value()) {
        outcome.detail = dir_ret.value();
        return outcome;
    }

    emit_status(std::string("Downloading: ") + file.name);
    const auto queue = events;
    const auto download_ret = source->download(file.id, file.mime_type, destination, [queue](unsigned long long bytes, unsigned long long total) {
        queue->push_back(FileProgress { bytes, total });
    });
    if (std::holds_alternative<std::string>(download_ret)) {
        outcome.detail = std::get<std::string>(download_ret);
        return outcome;
    }
    const auto actual_path = std::get<std::filesystem::path>(download_ret);

    // exported documents have no predictable size
    std::optional<unsigned long long> expected_size;
    if (!is_virtual_document(file.mime_type)) {
        expected_size = file.size;
    }
    if (!verify_transfer(*store, actual_path, expected_size)) {
        outcome.detail = "Download verification failed";
        outcome.local_path = actual_path;
        return outcome;
    }
    outcome.local_path = actual_path;

    if (options.trash_after) {
        emit_status(std::string("Moving to trash: ") + file.name);
        const auto trash_ret = source->trash(file.id);
        if (trash_ret.has_value()) {
            outcome.detail = std::string("trash failed: ") + trash_ret.value();
            return outcome;
        }
    }

    outcome.success = true;
    outcome.detail = std::string(options.trash_after ? "Downloaded and trashed" : "Downloaded") + " to " + actual_path.u8string();
    return outcome;
}

void ArchiveTask::run() {
    if (state() != task_state_t::Idle) {
        return;
    }
    set_state(task_state_t::Running);

    try {
        if (options.dry_run) {
            emit_status("Dry run - simulating archive...");
        } else {
            emit_status("Connecting to Google Drive...");
            const auto connect_ret = source->connect();
            if (std::holds_alternative<std::string>(connect_ret)) {
                fail(std::get<std::string>(connect_ret));
                return;
            }
        }

        const auto total = files.size();
        bool cancelled = false;
        for (size_t i = 0; i < total; i++) {
            // cancellation is only checked between files
            if (is_cancelled()) {
                cancelled = true;
                emit_status("Archive cancelled");
                break;
            }
            const auto &file = files[i];
            events->push_back(ArchiveProgress { i + 1, total, file.name });

            transfer_outcome_t outcome;
            try {
                outcome = process_file(file);
            } catch (const std::exception &e) {
                outcome = transfer_outcome_t { file.id, file.name, false, std::string("Error: ") + e.what(), std::nullopt };
            }
            if (outcome.success) {
                success_count++;
            } else {
                fprintf(stderr, "[archive] %s: %s\n", file.name.c_str(), outcome.detail.c_str());
                failure_count++;
            }
            record(outcome);
            events->push_back(FileResult { outcome });
        }

        const auto mode = options.dry_run ? "Dry run" : "Archive";
        emit_status(std::string(mode) + " complete: " + std::to_string(success_count.load()) + " succeeded, " + std::to_string(failure_count.load()) + " failed");
        set_state(cancelled ? task_state_t::Cancelled : task_state_t::Completed);
        events->push_back(ArchiveCompleted { result() });
    } catch (const std::exception &e) {
        fail(std::string("Archive failed: ") + e.what());
    }
}
