#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "../eligibility/eligibility.hpp"

#define CONFIG_DIR_ENV "DRIVE_ARCHIVER_CONFIG_DIR"
#define CONFIG_FILE_NAME "config.json"
#define JOURNAL_FILE_NAME "archive.sqlite"
#define CREDENTIALS_FILE_NAME "token.json"

#define DEFAULT_MIN_SIZE_MB 200
#define DEFAULT_BEFORE_DATE "2020-01-01"

struct drive_config_t {
    bool connected;
    std::string account_email;
};

struct rules_config_t {
    filter_mode_t filter_mode;
    unsigned long long min_size_mb;
    // empty means no cutoff
    std::string before_date;
    bool include_google_docs;
    bool dry_run;
    bool trash_after;
};

struct app_config_t {
    drive_config_t drive;
    std::string archive_path;
    rules_config_t rules;
};

app_config_t default_config();

// $DRIVE_ARCHIVER_CONFIG_DIR, $XDG_CONFIG_HOME/drive-archiver or ~/.drive_archiver
std::filesystem::path config_dir();

// Keys missing from the file keep their default values. A missing file gives
// the defaults, an unreadable or malformed one gives the defaults and a warning.
app_config_t load_config(const std::filesystem::path &path);

// parse a JSON document on top of the defaults, returns an error for malformed input
std::variant<app_config_t, std::string> parse_config(const std::string &text);
std::string dump_config(const app_config_t &config);

// writes through a temporary sibling so a crash never leaves a truncated file
std::optional<std::string> save_config(const app_config_t &config, const std::filesystem::path &path);

rule_set_t make_rule_set(const app_config_t &config);

// error message if the archive root can not be used
std::optional<std::string> validate_archive_root(const std::string &path);
