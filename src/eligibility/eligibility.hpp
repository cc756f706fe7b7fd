#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../remote/remote_file.hpp"

#define BYTES_IN_MB (1024ULL * 1024ULL)

enum class filter_mode_t {
    Size,
    Date
};

// Immutable per run, copied into each task at submission.
struct rule_set_t {
    unsigned long long min_size_mb;
    // YYYY-MM-DD, files modified on or after it are excluded
    std::optional<std::string> before_date;
    filter_mode_t filter_mode;
    bool include_google_docs;
};

const char *filter_mode_name(filter_mode_t mode);
std::optional<filter_mode_t> parse_filter_mode(const std::string &value);

bool is_eligible_file(const remote_file_t &file, const rule_set_t &rules);

// keeps input order
std::vector<remote_file_t> filter_eligible_files(const std::vector<remote_file_t> &files, const rule_set_t &rules);

// cheap per-page filter applied while listing, the full predicate runs again at the end
bool passes_page_filter(const remote_file_t &file, const rule_set_t &rules);

unsigned long long total_size(const std::vector<remote_file_t> &files);

// 512 B, 1.5 KB, 200.0 MB, 1.25 GB
std::string format_size(unsigned long long size_bytes);
