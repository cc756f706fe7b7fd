#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <sqlite3.h>

#include "../tasks/events.hpp"

#define ARCHIVED_FILES_TABLE_NAME "archived_files"

struct journal_entry_t {
    std::string file_id;
    std::string name;
    std::string local_path;
    bool success;
    std::string detail;
    bool dry_run;
    std::string archived_at;
};

// Log of every transfer outcome, oldest first.
// Methods throw std::runtime_error on database errors.
class ArchiveJournal {
public:
    ArchiveJournal(std::shared_ptr<sqlite3> db_, bool reset = false);

    void record(const transfer_outcome_t &outcome, bool dry_run);
    std::vector<journal_entry_t> entries() const;
    // ids archived successfully by real (not simulated) runs
    std::unordered_set<std::string> archived_ids() const;
    void clear();

private:
    std::shared_ptr<sqlite3> db;
};

// UTC, 2024-01-15T10:30:00Z
std::string current_timestamp();
