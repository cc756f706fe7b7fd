#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../deque/deque.hpp"
#include "../remote/remote_file.hpp"
#include "./task.hpp"

struct TaskStatus {
    std::string text;
};

// whole-run failure; always the last event of a failed run
struct TaskError {
    std::string message;
};

struct ScanProgress {
    size_t count;
};

struct ScanCompleted {
    std::vector<remote_file_t> files;
    unsigned long long total_bytes;
};

struct ScanCancelled {};

typedef std::variant<ScanProgress, TaskStatus, ScanCompleted, ScanCancelled, TaskError> ScanEvent;

struct transfer_outcome_t {
    std::string file_id;
    std::string name;
    bool success;
    std::string detail;
    // destination written, or the one a dry run would use
    std::optional<std::filesystem::path> local_path;
};

struct aggregate_result_t {
    size_t success_count;
    size_t failure_count;
    size_t total;
    task_state_t state;
};

struct ArchiveProgress {
    size_t current;
    size_t total;
    std::string name;
};

struct FileProgress {
    unsigned long long bytes;
    unsigned long long total;
};

struct FileResult {
    transfer_outcome_t outcome;
};

// terminal event for completed and cancelled runs
struct ArchiveCompleted {
    aggregate_result_t result;
};

typedef std::variant<ArchiveProgress, FileProgress, FileResult, TaskStatus, ArchiveCompleted, TaskError> ArchiveEvent;

typedef ThreadSafeDeque<ScanEvent> ScanEventQueue;
typedef ThreadSafeDeque<ArchiveEvent> ArchiveEventQueue;
