#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../local_store/local_store.hpp"
#include "./config.hpp"

using json = nlohmann::json;

app_config_t default_config() {
    return app_config_t {
        drive_config_t { false, "" },
        "",
        rules_config_t { filter_mode_t::Size, DEFAULT_MIN_SIZE_MB, DEFAULT_BEFORE_DATE, true, true, true }
    };
}

static std::optional<std::string> env_value(const char *name) {
    const auto value = std::getenv(name);
    if (value == nullptr || std::string(value).empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path config_dir() {
    const auto explicit_dir = env_value(CONFIG_DIR_ENV);
    if (explicit_dir.has_value()) {
        return std::filesystem::u8path(explicit_dir.value());
    }
    const auto xdg_dir = env_value("XDG_CONFIG_HOME");
    if (xdg_dir.has_value()) {
        return std::filesystem::u8path(xdg_dir.value()) / "drive-archiver";
    }
    const auto home_dir = env_value("HOME");
    if (home_dir.has_value()) {
        return std::filesystem::u8path(home_dir.value()) / ".drive_archiver";
    }
    return std::filesystem::path(".drive_archiver");
}

template<class T>
static void read_key(const json &object, const char *key, T &out) {
    if (!object.is_object() || !object.contains(key)) {
        return;
    }
    out = object.at(key).get<T>();
}

std::variant<app_config_t, std::string> parse_config(const std::string &text) {
    auto config = default_config();
    try {
        const auto root = json::parse(text);
        if (!root.is_object()) {
            return std::string("Configuration root is not an object");
        }
        if (root.contains("drive")) {
            const auto &drive = root.at("drive");
            read_key(drive, "connected", config.drive.connected);
            read_key(drive, "account_email", config.drive.account_email);
        }
        if (root.contains("archive")) {
            read_key(root.at("archive"), "path", config.archive_path);
        }
        if (root.contains("rules")) {
            const auto &rules = root.at("rules");
            std::string mode = filter_mode_name(config.rules.filter_mode);
            read_key(rules, "filter_mode", mode);
            const auto parsed_mode = parse_filter_mode(mode);
            if (!parsed_mode.has_value()) {
                return std::string("Unknown filter mode \"") + mode + "\"";
            }
            config.rules.filter_mode = parsed_mode.value();
            if (rules.contains("min_size_mb") && rules.at("min_size_mb").is_number() && rules.at("min_size_mb").get<double>() < 0) {
                return std::string("Minimum size must not be negative");
            }
            read_key(rules, "min_size_mb", config.rules.min_size_mb);
            if (rules.contains("before_date") && rules.at("before_date").is_null()) {
                config.rules.before_date = "";
            } else {
                read_key(rules, "before_date", config.rules.before_date);
            }
            read_key(rules, "include_google_docs", config.rules.include_google_docs);
            read_key(rules, "dry_run", config.rules.dry_run);
            read_key(rules, "trash_after", config.rules.trash_after);
        }
    } catch (const json::exception &e) {
        return std::string("Malformed configuration: ") + e.what();
    }
    return config;
}

app_config_t load_config(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return default_config();
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        fprintf(stderr, "Could not read configuration \"%s\", using defaults\n", path.u8string().c_str());
        return default_config();
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    const auto parse_ret = parse_config(buffer.str());
    if (std::holds_alternative<std::string>(parse_ret)) {
        fprintf(stderr, "%s in \"%s\", using defaults\n", std::get<std::string>(parse_ret).c_str(), path.u8string().c_str());
        return default_config();
    }
    return std::get<app_config_t>(parse_ret);
}

std::string dump_config(const app_config_t &config) {
    json root;
    root["drive"]["connected"] = config.drive.connected;
    root["drive"]["account_email"] = config.drive.account_email;
    root["archive"]["path"] = config.archive_path;
    root["rules"]["filter_mode"] = filter_mode_name(config.rules.filter_mode);
    root["rules"]["min_size_mb"] = config.rules.min_size_mb;
    root["rules"]["before_date"] = config.rules.before_date;
    root["rules"]["include_google_docs"] = config.rules.include_google_docs;
    root["rules"]["dry_run"] = config.rules.dry_run;
    root["rules"]["trash_after"] = config.rules.trash_after;
    return root.dump(2);
}

std::optional<std::string> save_config(const app_config_t &config, const std::filesystem::path &path) {
    FilesystemStore store;
    if (path.has_parent_path()) {
        const auto dir_ret = store.ensure_dir(path.parent_path());
        if (dir_ret.has_value()) {
            return dir_ret;
        }
    }
    return store.atomic_write(path, dump_config(config) + "\n");
}

rule_set_t make_rule_set(const app_config_t &config) {
    rule_set_t rules { config.rules.min_size_mb, std::nullopt, config.rules.filter_mode, config.rules.include_google_docs };
    if (config.rules.filter_mode == filter_mode_t::Date) {
        rules.min_size_mb = 0;
        if (!config.rules.before_date.empty()) {
            rules.before_date = config.rules.before_date;
        }
    }
    return rules;
}

std::optional<std::string> validate_archive_root(const std::string &path) {
    if (path.empty()) {
        return std::string("Archive location is not set");
    }
    auto root = std::filesystem::u8path(path);
    // "a/b/" names the directory b
    if (!root.has_filename() && root.has_parent_path()) {
        root = root.parent_path();
    }
    auto parent = root.parent_path();
    if (parent.empty()) {
        parent = std::filesystem::path(".");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(parent, ec)) {
        return std::string("Parent directory of archive location does not exist: ") + parent.u8string();
    }
    return std::nullopt;
}
