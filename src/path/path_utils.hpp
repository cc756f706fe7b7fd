#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#define UNNAMED_FILE_NAME "unnamed"

struct drive_date_t {
    int year;
    int month;
    int day;
};

// replaces <>:"/\|?* and control characters with '_', trims spaces and dots,
// falls back to "unnamed" when nothing is left
std::string clean_file_name(const std::string &file_name);

// accepts YYYY-MM-DD optionally followed by a 'T' time part (RFC 3339)
std::optional<drive_date_t> parse_drive_date(const std::string &value);

// <root>/<Category>/<year>/<year>-<month>/<name> for date-bucketed categories with a date,
// <root>/<Category>/<name> otherwise. file_name must already be cleaned.
std::filesystem::path plan_local_path(
    const std::filesystem::path &root,
    const std::string &file_name,
    const std::string &mime_type,
    const std::optional<drive_date_t> &modified_date);

// returns path unchanged when it is free, otherwise the first free "stem (n)ext", n = 1, 2, ...
std::filesystem::path unique_path(
    const std::filesystem::path &path,
    const std::function<bool(const std::filesystem::path &)> &exists);

// "a/report.gdoc" + ".docx" -> "a/report.docx"
std::filesystem::path replace_extension(const std::filesystem::path &path, const std::string &extension);
