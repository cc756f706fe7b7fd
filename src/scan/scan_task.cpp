#include <cstdio>
#include <exception>

#include "./scan_task.hpp"

ScanTask::ScanTask(
    std::shared_ptr<RemoteFileSource> source_,
    std::shared_ptr<ScanEventQueue> events_,
    const rule_set_t &rules_,
    unsigned int page_size_) :
    source {source_},
    events {events_},
    rules {rules_},
    page_size {page_size_ == 0 ? DEFAULT_PAGE_SIZE : page_size_} {}

task_kind_t ScanTask::kind() const {
    return task_kind_t::Scan;
}

const std::vector<remote_file_t> &ScanTask::result() const {
    return eligible;
}

void ScanTask::emit_status(const std::string &text) {
    fprintf(stdout, "[scan] %s\n", text.c_str());
    events->push_back(TaskStatus { text });
}

void ScanTask::fail(const std::string &message) {
    fprintf(stderr, "[scan] %s\n", message.c_str());
    set_state(task_state_t::Failed);
    events->push_back(TaskError { message });
}

void ScanTask::run() {
    if (state() != task_state_t::Idle) {
        return;
    }
    set_state(task_state_t::Running);

    try {
        if (is_cancelled()) {
            set_state(task_state_t::Cancelled);
            emit_status("Scan cancelled");
            events->push_back(ScanCancelled {});
            return;
        }

        emit_status("Connecting to Google Drive...");
        const auto connect_ret = source->connect();
        if (std::holds_alternative<std::string>(connect_ret)) {
            fail(std::get<std::string>(connect_ret));
            return;
        }

        emit_status("Scanning files...");
        std::vector<remote_file_t> matches;
        page_query_t query { page_size, std::nullopt };
        while (true) {
            const auto page_ret = source->list_page(query);
            if (std::holds_alternative<std::string>(page_ret)) {
                fail(std::get<std::string>(page_ret));
                return;
            }
            const auto &page = std::get<remote_page_t>(page_ret);
            for (const auto &f : page.files) {
                if (passes_page_filter(f, rules)) {
                    matches.push_back(f);
                }
            }
            events->push_back(ScanProgress { matches.size() });

            // cancellation is only checked between pages
            if (is_cancelled()) {
                set_state(task_state_t::Cancelled);
                emit_status("Scan cancelled");
                events->push_back(ScanCancelled {});
                return;
            }
            if (!page.next_page_token.has_value()) {
                break;
            }
            query.page_token = page.next_page_token;
        }

        emit_status("Filtering eligible files...");
        eligible = filter_eligible_files(matches, rules);
        emit_status(std::string("Found ") + std::to_string(eligible.size()) + " files");
        set_state(task_state_t::Completed);
        events->push_back(ScanCompleted { eligible, total_size(eligible) });
    } catch (const std::exception &e) {
        fail(std::string("Scan failed: ") + e.what());
    }
}
