#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <unordered_set>

#include <cxxopts.hpp>
#include <sqlite3.h>

#include "./classifier/classifier.hpp"
#include "./config/config.hpp"
#include "./curl/curl.hpp"
#include "./db/sqlite.hpp"
#include "./drive/drive_client.hpp"
#include "./eligibility/eligibility.hpp"
#include "./journal/journal.hpp"
#include "./local_store/local_store.hpp"
#include "./path/path_utils.hpp"
#include "./session/session.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define APP_VERSION XSTRING(CMAKE_PROJECT_VERSION)

#define EXIT_CANCELLED 130
#define PUMP_WAIT std::chrono::milliseconds(200)

static std::atomic<bool> interrupted {false};

static void handle_interrupt(int) {
    interrupted = true;
}

static void print_usage(const cxxopts::Options &options) {
    fprintf(stderr, "%s", options.help().c_str());
    fprintf(stderr, "Commands:\n");
    fprintf(stderr, "  scan                 list files eligible for archiving\n");
    fprintf(stderr, "  archive              scan, then archive eligible files\n");
    fprintf(stderr, "  plan <name>          show where a file would be archived\n");
    fprintf(stderr, "  history              show archived files\n");
    fprintf(stderr, "  config               show the effective configuration\n");
}

static std::string modified_date_text(const remote_file_t &file) {
    if (!file.modified_time.has_value()) {
        return "unknown";
    }
    return file.modified_time->substr(0, 10);
}

static void print_file_list(const std::vector<remote_file_t> &files, const std::filesystem::path &archive_root) {
    for (const auto &f : files) {
        const auto date = f.modified_time.has_value() ? parse_drive_date(f.modified_time.value()) : std::nullopt;
        const auto planned = plan_local_path(archive_root, clean_file_name(f.name), f.mime_type, date);
        fprintf(stdout, "%s\t%s\t%s\t%s\t%s\n",
            f.name.c_str(),
            is_virtual_document(f.mime_type) ? "-" : format_size(f.size).c_str(),
            modified_date_text(f).c_str(),
            category_name(classify_file(f.name, f.mime_type)),
            planned.u8string().c_str());
    }
}

static std::variant<access_token_t, std::string> resolve_access_token(const cxxopts::ParseResult &args) {
    const auto env_token = std::getenv(ACCESS_TOKEN_ENV);
    if (env_token != nullptr && std::string(env_token).size() > 0) {
        return access_token_t { std::string(env_token) };
    }
    auto token_path = (config_dir() / CREDENTIALS_FILE_NAME).u8string();
    if (args.count("token")) {
        token_path = args["token"].as<std::string>();
    }
    return load_access_token(token_path);
}

// runs the scan to its end and returns the exit code
static int run_scan(ArchiveSession &session, std::vector<remote_file_t> &eligible) {
    const auto start_ret = session.start_scan();
    if (start_ret.has_value()) {
        fprintf(stderr, "Could not start scan: %s\n", start_ret.value().c_str());
        return EXIT_FAILURE;
    }

    std::optional<int> exit_code;
    session_handlers_t handlers;
    handlers.on_scan_progress = [](size_t count) {
        fprintf(stdout, "Scanning... %zu matching files so far\n", count);
    };
    handlers.on_status = [](task_kind_t, const std::string &text) {
        fprintf(stdout, "%s\n", text.c_str());
    };
    handlers.on_scan_completed = [&](const std::vector<remote_file_t> &files, unsigned long long total_bytes) {
        eligible = files;
        fprintf(stdout, "%zu eligible files, %s to free\n", files.size(), format_size(total_bytes).c_str());
        exit_code = EXIT_SUCCESS;
    };
    handlers.on_scan_cancelled = [&]() {
        exit_code = EXIT_CANCELLED;
    };
    handlers.on_error = [&](task_kind_t, const std::string &message) {
        fprintf(stderr, "Scan failed: %s\n", message.c_str());
        exit_code = EXIT_FAILURE;
    };

    bool cancel_requested = false;
    while (!exit_code.has_value()) {
        if (interrupted && !cancel_requested) {
            fprintf(stdout, "Cancelling scan...\n");
            session.cancel();
            cancel_requested = true;
        }
        session.pump(handlers, PUMP_WAIT);
    }
    return exit_code.value();
}

static int run_archive(ArchiveSession &session, const std::vector<remote_file_t> &files) {
    const auto start_ret = session.start_archive(files);
    if (start_ret.has_value()) {
        fprintf(stderr, "Could not start archive: %s\n", start_ret.value().c_str());
        return EXIT_FAILURE;
    }

    std::optional<int> exit_code;
    session_handlers_t handlers;
    handlers.on_archive_progress = [](size_t current, size_t total, const std::string &name) {
        fprintf(stdout, "[%zu/%zu] %s\n", current, total, name.c_str());
    };
    handlers.on_status = [](task_kind_t, const std::string &text) {
        fprintf(stdout, "%s\n", text.c_str());
    };
    handlers.on_file_result = [](const transfer_outcome_t &outcome) {
        fprintf(outcome.success ? stdout : stderr, "%s %s: %s\n", outcome.success ? "OK  " : "FAIL", outcome.name.c_str(), outcome.detail.c_str());
    };
    handlers.on_archive_completed = [&](const aggregate_result_t &result) {
        fprintf(stdout, "%zu of %zu files succeeded, %zu failed (%s)\n",
            result.success_count, result.total, result.failure_count, task_state_name(result.state));
        exit_code = result.state == task_state_t::Cancelled ? EXIT_CANCELLED : EXIT_SUCCESS;
    };
    handlers.on_error = [&](task_kind_t, const std::string &message) {
        fprintf(stderr, "Archive failed: %s\n", message.c_str());
        exit_code = EXIT_FAILURE;
    };

    bool cancel_requested = false;
    while (!exit_code.has_value()) {
        if (interrupted && !cancel_requested) {
            fprintf(stdout, "Cancelling after the current file...\n");
            session.cancel();
            cancel_requested = true;
        }
        session.pump(handlers, PUMP_WAIT);
    }
    return exit_code.value();
}

static std::optional<std::string> apply_overrides(app_config_t &config, const cxxopts::ParseResult &args) {
    if (args.count("archive-path")) {
        config.archive_path = args["archive-path"].as<std::string>();
    }
    if (args.count("min-size")) {
        config.rules.min_size_mb = args["min-size"].as<unsigned long long>();
    }
    if (args.count("before")) {
        const auto before = args["before"].as<std::string>();
        if (!before.empty() && !parse_drive_date(before).has_value()) {
            return std::string("Invalid date \"") + before + "\", expected YYYY-MM-DD";
        }
        config.rules.before_date = before;
    }
    if (args.count("filter-mode")) {
        const auto mode = parse_filter_mode(args["filter-mode"].as<std::string>());
        if (!mode.has_value()) {
            return std::string("Filter mode must be \"size\" or \"date\"");
        }
        config.rules.filter_mode = mode.value();
    }
    if (args.count("dry-run") && args.count("no-dry-run")) {
        return std::string("--dry-run and --no-dry-run can not be combined");
    }
    if (args.count("dry-run")) {
        config.rules.dry_run = true;
    }
    if (args.count("no-dry-run")) {
        config.rules.dry_run = false;
    }
    if (args.count("trash") && args.count("no-trash")) {
        return std::string("--trash and --no-trash can not be combined");
    }
    if (args.count("trash")) {
        config.rules.trash_after = true;
    }
    if (args.count("no-trash")) {
        config.rules.trash_after = false;
    }
    return std::nullopt;
}

int main(int argc, char const* argv[]) {
    cxxopts::Options options(APP_NAME, "Archive large or old Google Drive files to a local folder");

    options.add_options()
           ("command", "scan, archive, plan, history or config", cxxopts::value<std::string>())
           ("name", "File name for the plan command", cxxopts::value<std::string>())
           ("c,config", "Configuration file. Default is <config-dir>/" CONFIG_FILE_NAME, cxxopts::value<std::string>())
           ("t,token", "OAuth token JSON file. Default is <config-dir>/" CREDENTIALS_FILE_NAME, cxxopts::value<std::string>())
           ("a,archive-path", "Local archive folder", cxxopts::value<std::string>())
           ("m,min-size", "Minimum file size in MB for the size filter", cxxopts::value<unsigned long long>())
           ("b,before", "Only files modified before YYYY-MM-DD for the date filter", cxxopts::value<std::string>())
           ("f,filter-mode", "Filter mode: size or date", cxxopts::value<std::string>())
           ("dry-run", "Only report what would be archived")
           ("no-dry-run", "Download files")
           ("trash", "Move archived files to Drive trash")
           ("no-trash", "Keep archived files on Drive")
           ("o,only", "Archive only the file with this id (repeatable)", cxxopts::value<std::vector<std::string>>())
           ("mime", "Media type for the plan command", cxxopts::value<std::string>()->default_value(""))
           ("modified", "Modification date for the plan command", cxxopts::value<std::string>()->default_value(""))
           ("s,save", "Save the effective configuration")
           ("v,version", "Show version")
           ("h,help", "Show help");
    options.parse_positional({"command", "name"});
    options.positional_help("<command> [name]");

    cxxopts::ParseResult args;

    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &x) {
        fprintf(stderr, "%s: %s\n", APP_NAME, x.what());
        print_usage(options);
        return EXIT_FAILURE;
    }

    if (args.count("help")) {
        print_usage(options);
        return EXIT_SUCCESS;
    }

    if (args.count("version")) {
        fprintf(stderr, "%s: %s\n", APP_NAME, APP_VERSION);
        return EXIT_SUCCESS;
    }

    if (!args.count("command")) {
        fprintf(stderr, "Command is not set.\n");
        print_usage(options);
        return EXIT_FAILURE;
    }
    const auto command = args["command"].as<std::string>();

    auto config_path = config_dir() / CONFIG_FILE_NAME;
    if (args.count("config")) {
        config_path = std::filesystem::u8path(args["config"].as<std::string>());
    }
    auto config = load_config(config_path);
    const auto override_ret = apply_overrides(config, args);
    if (override_ret.has_value()) {
        fprintf(stderr, "%s\n", override_ret.value().c_str());
        return EXIT_FAILURE;
    }
    if (args.count("save")) {
        const auto save_ret = save_config(config, config_path);
        if (save_ret.has_value()) {
            fprintf(stderr, "Could not save configuration: %s\n", save_ret.value().c_str());
            return EXIT_FAILURE;
        }
        fprintf(stdout, "Configuration saved to \"%s\"\n", config_path.u8string().c_str());
    }

    if (command == "config") {
        fprintf(stdout, "%s\n", dump_config(config).c_str());
        return EXIT_SUCCESS;
    }

    if (command == "plan") {
        if (!args.count("name")) {
            fprintf(stderr, "File name is not set.\n");
            return EXIT_FAILURE;
        }
        const auto modified = args["modified"].as<std::string>();
        const auto date = modified.empty() ? std::nullopt : parse_drive_date(modified);
        if (!modified.empty() && !date.has_value()) {
            fprintf(stderr, "Invalid date \"%s\"\n", modified.c_str());
            return EXIT_FAILURE;
        }
        const auto root = config.archive_path.empty() ? std::filesystem::path(".") : std::filesystem::u8path(config.archive_path);
        const auto planned = plan_local_path(root, clean_file_name(args["name"].as<std::string>()), args["mime"].as<std::string>(), date);
        fprintf(stdout, "%s\n", planned.u8string().c_str());
        return EXIT_SUCCESS;
    }

    const auto journal_path = (config_dir() / JOURNAL_FILE_NAME).u8string();
    const auto db_open_ret = db_open(journal_path);
    if (std::holds_alternative<std::string>(db_open_ret)) {
        fprintf(stderr, "Failed to open SQLite database: %s\n", std::get<std::string>(db_open_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto db = std::get<std::shared_ptr<sqlite3>>(db_open_ret);
    std::shared_ptr<ArchiveJournal> journal;
    try {
        journal = std::make_shared<ArchiveJournal>(db, false);
    } catch (const std::exception &e) {
        fprintf(stderr, "Failed to open archive journal: %s\n", e.what());
        return EXIT_FAILURE;
    }

    if (command == "history") {
        try {
            const auto entries = journal->entries();
            for (const auto &e : entries) {
                fprintf(stdout, "%s\t%s%s\t%s\t%s\n",
                    e.archived_at.c_str(),
                    e.success ? "OK" : "FAIL",
                    e.dry_run ? " (dry run)" : "",
                    e.name.c_str(),
                    e.detail.c_str());
            }
            fprintf(stdout, "%zu entries\n", entries.size());
        } catch (const std::exception &e) {
            fprintf(stderr, "Failed to read archive journal: %s\n", e.what());
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (command != "scan" && command != "archive") {
        fprintf(stderr, "Unknown command \"%s\".\n", command.c_str());
        print_usage(options);
        return EXIT_FAILURE;
    }

    const auto token_ret = resolve_access_token(args);
    if (std::holds_alternative<std::string>(token_ret)) {
        fprintf(stderr, "Not connected to Google Drive: %s\n", std::get<std::string>(token_ret).c_str());
        return EXIT_FAILURE;
    }

    http_global_init();
    std::signal(SIGINT, handle_interrupt);

    int exit_code = EXIT_SUCCESS;
    {
        auto source = std::make_shared<DriveClient>(std::get<access_token_t>(token_ret).token);
        auto store = std::make_shared<FilesystemStore>();
        ArchiveSession session(config, source, store, journal);

        std::vector<remote_file_t> eligible;
        exit_code = run_scan(session, eligible);
        if (exit_code == EXIT_SUCCESS && command == "scan") {
            const auto root = config.archive_path.empty() ? std::filesystem::path(".") : std::filesystem::u8path(config.archive_path);
            print_file_list(eligible, root);
        }

        if (exit_code == EXIT_SUCCESS && command == "archive") {
            std::vector<remote_file_t> selected;
            std::unordered_set<std::string> only;
            if (args.count("only")) {
                const auto ids = args["only"].as<std::vector<std::string>>();
                only.insert(ids.begin(), ids.end());
            }
            std::unordered_set<std::string> archived;
            try {
                archived = journal->archived_ids();
            } catch (const std::exception &e) {
                fprintf(stderr, "Failed to read archive journal: %s\n", e.what());
            }
            for (const auto &f : eligible) {
                if (!only.empty() && only.count(f.id) == 0) {
                    continue;
                }
                if (archived.count(f.id) > 0) {
                    fprintf(stdout, "Skipping \"%s\", already archived\n", f.name.c_str());
                    continue;
                }
                selected.push_back(f);
            }
            if (selected.empty()) {
                fprintf(stdout, "Nothing to archive\n");
            } else {
                exit_code = run_archive(session, selected);
            }
        }

        if (!session.shutdown()) {
            fprintf(stderr, "Some tasks did not stop in time\n");
        }
    }

    http_global_cleanup();
    return exit_code;
}
