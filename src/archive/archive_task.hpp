#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../journal/journal.hpp"
#include "../local_store/local_store.hpp"
#include "../remote/remote_source.hpp"
#include "../tasks/events.hpp"
#include "../tasks/task.hpp"

struct archive_options_t {
    // report what would happen without network or disk access
    bool dry_run;
    // trash the remote original after a verified download
    bool trash_after;
};

// a transfer is good when the file exists, is not empty and, when the expected
// size is known, matches it exactly
bool verify_transfer(const LocalStore &store, const std::filesystem::path &path, const std::optional<unsigned long long> &expected_size);

// Downloads an ordered list of remote files into the archive layout, one file
// at a time. A failing file never stops the run. Ends with ArchiveCompleted
// (Completed or Cancelled) or TaskError (Failed).
class ArchiveTask : public Task {
public:
    ArchiveTask(
        std::shared_ptr<RemoteFileSource> source_,
        std::shared_ptr<LocalStore> store_,
        std::shared_ptr<ArchiveEventQueue> events_,
        const std::vector<remote_file_t> &files_,
        const std::filesystem::path &archive_root_,
        const archive_options_t &options_,
        std::shared_ptr<ArchiveJournal> journal_ = nullptr);

    void run() override;
    task_kind_t kind() const override;

    // counts collected so far
    aggregate_result_t result() const;

private:
    transfer_outcome_t process_file(const remote_file_t &file);
    std::filesystem::path destination_for(const remote_file_t &file);
    void emit_status(const std::string &text);
    void fail(const std::string &message);
    void record(const transfer_outcome_t &outcome);

    std::shared_ptr<RemoteFileSource> source;
    std::shared_ptr<LocalStore> store;
    std::shared_ptr<ArchiveEventQueue> events;
    const std::vector<remote_file_t> files;
    const std::filesystem::path archive_root;
    const archive_options_t options;
    std::shared_ptr<ArchiveJournal> journal;
    // destinations handed out in this run, a dry run never creates them on disk
    std::set<std::filesystem::path> reserved;
    std::atomic<size_t> success_count {0};
    std::atomic<size_t> failure_count {0};
};
