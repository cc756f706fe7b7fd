#include <cstdio>

#include "./eligibility.hpp"

const char *filter_mode_name(filter_mode_t mode) {
    return mode == filter_mode_t::Date ? "date" : "size";
}

std::optional<filter_mode_t> parse_filter_mode(const std::string &value) {
    if (value == "size") {
        return filter_mode_t::Size;
    }
    if (value == "date") {
        return filter_mode_t::Date;
    }
    return std::nullopt;
}

static bool modified_before(const remote_file_t &file, const std::string &before_date) {
    if (!file.modified_time.has_value() || file.modified_time->empty()) {
        return true;
    }
    // ISO dates compare lexicographically
    return file.modified_time->substr(0, 10) < before_date;
}

static bool meets_size(const remote_file_t &file, const rule_set_t &rules) {
    return file.size >= rules.min_size_mb * BYTES_IN_MB;
}

bool is_eligible_file(const remote_file_t &file, const rule_set_t &rules) {
    if (is_skipped_type(file.mime_type)) {
        return false;
    }
    if (rules.before_date.has_value() && !rules.before_date->empty() && !modified_before(file, rules.before_date.value())) {
        return false;
    }
    if (is_virtual_document(file.mime_type)) {
        // size is always 0 remotely, threshold does not apply
        return rules.include_google_docs;
    }
    return meets_size(file, rules);
}

std::vector<remote_file_t> filter_eligible_files(const std::vector<remote_file_t> &files, const rule_set_t &rules) {
    std::vector<remote_file_t> ret;
    for (const auto &f : files) {
        if (is_eligible_file(f, rules)) {
            ret.push_back(f);
        }
    }
    return ret;
}

bool passes_page_filter(const remote_file_t &file, const rule_set_t &rules) {
    if (is_virtual_document(file.mime_type)) {
        return rules.include_google_docs;
    }
    if (!meets_size(file, rules)) {
        return false;
    }
    if (rules.before_date.has_value() && !rules.before_date->empty()) {
        return modified_before(file, rules.before_date.value());
    }
    return true;
}

unsigned long long total_size(const std::vector<remote_file_t> &files) {
    unsigned long long ret = 0;
    for (const auto &f : files) {
        ret += f.size;
    }
    return ret;
}

std::string format_size(unsigned long long size_bytes) {
    char buffer[64];
    if (size_bytes < 1024) {
        snprintf(buffer, sizeof(buffer), "%llu B", size_bytes);
    } else if (size_bytes < BYTES_IN_MB) {
        snprintf(buffer, sizeof(buffer), "%.1f KB", ((double) size_bytes) / 1024);
    } else if (size_bytes < BYTES_IN_MB * 1024) {
        snprintf(buffer, sizeof(buffer), "%.1f MB", ((double) size_bytes) / 1024 / 1024);
    } else {
        snprintf(buffer, sizeof(buffer), "%.2f GB", ((double) size_bytes) / 1024 / 1024 / 1024);
    }
    return buffer;
}
