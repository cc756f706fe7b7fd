#include "../src/remote/remote_file.hpp"
#include "fakes.hpp"

remote_file_t make_file(
    const std::string &id,
    const std::string &name,
    unsigned long long size,
    const std::string &mime_type,
    const std::string &modified_time) {
    remote_file_t file;
    file.id = id;
    file.name = name;
    file.size = size;
    file.mime_type = mime_type;
    if (!modified_time.empty()) {
        file.modified_time = modified_time;
    }
    return file;
}

std::optional<std::string> FakeLocalStore::ensure_dir(const std::filesystem::path &path) {
    ensure_dir_calls++;
    if (ensure_dir_error.has_value()) {
        return ensure_dir_error;
    }
    std::lock_guard<std::mutex> lock{ mutex };
    dirs.insert(path);
    return std::nullopt;
}

std::optional<std::string> FakeLocalStore::atomic_write(const std::filesystem::path &path, const std::string &bytes) {
    write_calls++;
    put(path, bytes);
    return std::nullopt;
}

bool FakeLocalStore::exists(const std::filesystem::path &path) const {
    std::lock_guard<std::mutex> lock{ mutex };
    return files.count(path) > 0 || dirs.count(path) > 0;
}

std::optional<unsigned long long> FakeLocalStore::file_size(const std::filesystem::path &path) const {
    std::lock_guard<std::mutex> lock{ mutex };
    const auto it = files.find(path);
    if (it == files.end()) {
        return std::nullopt;
    }
    return (unsigned long long) it->second.size();
}

std::variant<unsigned long long, std::string> FakeLocalStore::free_space(const std::filesystem::path &) const {
    return available_bytes;
}

std::optional<std::string> FakeLocalStore::remove(const std::filesystem::path &path) {
    remove_calls++;
    std::lock_guard<std::mutex> lock{ mutex };
    files.erase(path);
    return std::nullopt;
}

void FakeLocalStore::put(const std::filesystem::path &path, const std::string &bytes) {
    std::lock_guard<std::mutex> lock{ mutex };
    files[path] = bytes;
}

std::optional<std::string> FakeLocalStore::content(const std::filesystem::path &path) const {
    std::lock_guard<std::mutex> lock{ mutex };
    const auto it = files.find(path);
    if (it == files.end()) {
        return std::nullopt;
    }
    return it->second;
}

FakeRemoteSource::FakeRemoteSource(std::shared_ptr<FakeLocalStore> sink_) : sink {sink_} {}

std::variant<account_info_t, std::string> FakeRemoteSource::connect() {
    connect_calls++;
    if (connect_error.has_value()) {
        return connect_error.value();
    }
    return account_info_t { "user@example.com" };
}

std::variant<remote_page_t, std::string> FakeRemoteSource::list_page(const page_query_t &query) {
    list_calls++;
    {
        std::lock_guard<std::mutex> lock{ mutex };
        page_sizes.push_back(query.page_size);
    }
    const size_t index = query.page_token.has_value() ? std::stoul(query.page_token.value()) : 0;
    if (list_error_page.has_value() && list_error_page.value() == index) {
        return std::string("HTTP 500: backend error");
    }
    remote_page_t page;
    if (index < pages.size()) {
        page.files = pages[index];
    }
    if (index + 1 < pages.size()) {
        page.next_page_token = std::to_string(index + 1);
    }
    if (on_page) {
        on_page(index);
    }
    return page;
}

std::variant<std::filesystem::path, std::string> FakeRemoteSource::download(
    const std::string &file_id,
    const std::string &mime_type,
    const std::filesystem::path &destination,
    const transfer_progress_t &on_progress) {
    download_calls++;
    {
        std::lock_guard<std::mutex> lock{ mutex };
        downloads.push_back(file_id);
    }
    const auto error = download_errors.find(file_id);
    if (error != download_errors.end()) {
        if (on_download) {
            on_download(file_id);
        }
        return error->second;
    }
    auto actual = destination;
    const auto export_format = export_format_for(mime_type);
    if (export_format.has_value()) {
        actual = replace_extension(destination, export_format->extension);
    }
    const auto it = contents.find(file_id);
    const auto bytes = it == contents.end() ? std::string() : it->second;
    if (on_progress) {
        on_progress(bytes.size() / 2, bytes.size());
        on_progress(bytes.size(), bytes.size());
    }
    if (sink != nullptr) {
        sink->put(actual, bytes);
    }
    if (on_download) {
        on_download(file_id);
    }
    return actual;
}

std::optional<std::string> FakeRemoteSource::trash(const std::string &file_id) {
    trash_calls++;
    {
        std::lock_guard<std::mutex> lock{ mutex };
        trashes.push_back(file_id);
    }
    const auto error = trash_errors.find(file_id);
    if (error != trash_errors.end()) {
        return error->second;
    }
    return std::nullopt;
}

std::vector<unsigned int> FakeRemoteSource::requested_page_sizes() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return page_sizes;
}

std::vector<std::string> FakeRemoteSource::downloaded_ids() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return downloads;
}

std::vector<std::string> FakeRemoteSource::trashed_ids() const {
    std::lock_guard<std::mutex> lock{ mutex };
    return trashes;
}
