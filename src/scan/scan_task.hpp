#pragma once

#include <memory>
#include <vector>

#include "../eligibility/eligibility.hpp"
#include "../remote/remote_source.hpp"
#include "../tasks/events.hpp"
#include "../tasks/task.hpp"

// Pages through the remote listing and collects the files eligible under a
// rule set. Emits ScanEvent values on the queue given at construction and
// ends with exactly one of ScanCompleted, ScanCancelled or TaskError.
class ScanTask : public Task {
public:
    ScanTask(
        std::shared_ptr<RemoteFileSource> source_,
        std::shared_ptr<ScanEventQueue> events_,
        const rule_set_t &rules_,
        unsigned int page_size_ = DEFAULT_PAGE_SIZE);

    void run() override;
    task_kind_t kind() const override;

    // valid once the task is Completed
    const std::vector<remote_file_t> &result() const;

private:
    void emit_status(const std::string &text);
    void fail(const std::string &message);

    std::shared_ptr<RemoteFileSource> source;
    std::shared_ptr<ScanEventQueue> events;
    const rule_set_t rules;
    const unsigned int page_size;
    std::vector<remote_file_t> eligible;
};
