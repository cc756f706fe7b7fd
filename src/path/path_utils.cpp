#include <cstdio>

#include "../classifier/classifier.hpp"
#include "./path_utils.hpp"

static bool is_illegal_char(char c) {
    static const std::string illegal = "<>:\"/\\|?*";
    if (static_cast<unsigned char>(c) < 0x20) {
        return true;
    }
    return illegal.find(c) != std::string::npos;
}

std::string clean_file_name(const std::string &file_name) {
    std::string cleaned = file_name;
    for (auto &c : cleaned) {
        if (is_illegal_char(c)) {
            c = '_';
        }
    }
    const auto first = cleaned.find_first_not_of(" .");
    if (first == std::string::npos) {
        return UNNAMED_FILE_NAME;
    }
    const auto last = cleaned.find_last_not_of(" .");
    return cleaned.substr(first, last - first + 1);
}

static bool parse_number(const std::string &value, size_t offset, size_t length, int &out) {
    if (offset + length > value.size()) {
        return false;
    }
    int ret = 0;
    for (size_t i = offset; i < offset + length; i++) {
        if (value[i] < '0' || value[i] > '9') {
            return false;
        }
        ret = ret * 10 + (value[i] - '0');
    }
    out = ret;
    return true;
}

std::optional<drive_date_t> parse_drive_date(const std::string &value) {
    if (value.size() < 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }
    if (value.size() > 10 && value[10] != 'T' && value[10] != 't' && value[10] != ' ') {
        return std::nullopt;
    }
    drive_date_t date {0, 0, 0};
    if (!parse_number(value, 0, 4, date.year) || !parse_number(value, 5, 2, date.month) || !parse_number(value, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return std::nullopt;
    }
    return date;
}

std::filesystem::path plan_local_path(
    const std::filesystem::path &root,
    const std::string &file_name,
    const std::string &mime_type,
    const std::optional<drive_date_t> &modified_date) {
    const auto category = classify_file(file_name, mime_type);
    auto folder = root / category_name(category);
    if (is_date_bucketed(category) && modified_date.has_value()) {
        char year[16];
        char month[16];
        snprintf(year, sizeof(year), "%04d", modified_date->year);
        snprintf(month, sizeof(month), "%04d-%02d", modified_date->year, modified_date->month);
        folder = folder / year / month;
    }
    return folder / std::filesystem::u8path(file_name);
}

std::filesystem::path unique_path(
    const std::filesystem::path &path,
    const std::function<bool(const std::filesystem::path &)> &exists) {
    if (!exists(path)) {
        return path;
    }
    const auto parent = path.parent_path();
    const auto stem = path.stem().u8string();
    const auto extension = path.extension().u8string();
    for (unsigned long long counter = 1;; counter++) {
        const auto candidate = parent / std::filesystem::u8path(stem + " (" + std::to_string(counter) + ")" + extension);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

std::filesystem::path replace_extension(const std::filesystem::path &path, const std::string &extension) {
    auto ret = path;
    ret.replace_extension(extension);
    return ret;
}
