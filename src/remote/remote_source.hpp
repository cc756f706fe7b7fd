#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "./remote_file.hpp"

#define DEFAULT_PAGE_SIZE 100
#define MAX_PAGE_SIZE 1000

struct account_info_t {
    std::string email;
};

struct page_query_t {
    unsigned int page_size;
    std::optional<std::string> page_token;
};

struct remote_page_t {
    std::vector<remote_file_t> files;
    std::optional<std::string> next_page_token;
};

// (bytes so far, total bytes); total is 0 when the remote does not announce it
typedef std::function<void(unsigned long long, unsigned long long)> transfer_progress_t;

// Remote store the archiver reads from. A session hands the same instance to
// its scan and archive tasks, so implementations must allow concurrent calls
// from several worker threads.
class RemoteFileSource {
public:
    virtual ~RemoteFileSource() = default;

    // checks that the remote is reachable and the credentials are accepted
    virtual std::variant<account_info_t, std::string> connect() = 0;

    // non-trashed files owned by the caller, most recently modified first
    virtual std::variant<remote_page_t, std::string> list_page(const page_query_t &query) = 0;

    // Writes the content of file_id to destination. Virtual documents are exported
    // instead and the returned path carries the export extension.
    virtual std::variant<std::filesystem::path, std::string> download(
        const std::string &file_id,
        const std::string &mime_type,
        const std::filesystem::path &destination,
        const transfer_progress_t &on_progress) = 0;

    // reversible soft delete, idempotent
    virtual std::optional<std::string> trash(const std::string &file_id) = 0;
};
