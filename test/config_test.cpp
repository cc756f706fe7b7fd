#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "../src/config/config.hpp"
#include "test_utils.hpp"

TEST(config_test, defaults) {
    const auto config = default_config();
    EXPECT_FALSE(config.drive.connected);
    EXPECT_EQ(config.archive_path, "");
    EXPECT_EQ(config.rules.filter_mode, filter_mode_t::Size);
    EXPECT_EQ(config.rules.min_size_mb, 200);
    EXPECT_EQ(config.rules.before_date, "2020-01-01");
    EXPECT_TRUE(config.rules.include_google_docs);
    EXPECT_TRUE(config.rules.dry_run);
    EXPECT_TRUE(config.rules.trash_after);
}

TEST(config_test, merge_missing_keys) {
    const auto ret = parse_config("{\"archive\": {\"path\": \"/data/archive\"}, \"rules\": {\"min_size_mb\": 50, \"dry_run\": false}}");
    ASSERT_TRUE(std::holds_alternative<app_config_t>(ret));
    const auto &config = std::get<app_config_t>(ret);
    EXPECT_EQ(config.archive_path, "/data/archive");
    EXPECT_EQ(config.rules.min_size_mb, 50);
    EXPECT_FALSE(config.rules.dry_run);
    EXPECT_TRUE(config.rules.trash_after);
    EXPECT_EQ(config.rules.before_date, "2020-01-01");
}

TEST(config_test, malformed) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_config("{not json")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_config("{\"rules\": {\"min_size_mb\": \"big\"}}")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_config("{\"rules\": {\"filter_mode\": \"age\"}}")));
}

TEST(config_test, negative_min_size) {
    const auto parsed = parse_config("{\"rules\": {\"min_size_mb\": -5}}");
    ASSERT_TRUE(std::holds_alternative<std::string>(parsed));
    EXPECT_EQ(std::get<std::string>(parsed), "Minimum size must not be negative");

    const auto zero = parse_config("{\"rules\": {\"min_size_mb\": 0}}");
    ASSERT_TRUE(std::holds_alternative<app_config_t>(zero));
    EXPECT_EQ(std::get<app_config_t>(zero).rules.min_size_mb, 0);
}

TEST(config_test, load_falls_back_to_defaults) {
    const auto dir = make_tmp_dir("config_load");
    const auto missing = load_config(dir / "missing.json");
    EXPECT_EQ(missing.rules.min_size_mb, 200);

    const auto broken_path = dir / "broken.json";
    std::ofstream(broken_path) << "{\"rules\": ";
    const auto broken = load_config(broken_path);
    EXPECT_EQ(broken.rules.min_size_mb, 200);
}

TEST(config_test, save_and_load) {
    const auto dir = make_tmp_dir("config_save");
    const auto path = dir / "nested" / CONFIG_FILE_NAME;
    auto config = default_config();
    config.archive_path = "/mnt/backup/drive";
    config.rules.filter_mode = filter_mode_t::Date;
    config.rules.before_date = "2021-06-30";
    config.rules.trash_after = false;
    EXPECT_EQ(save_config(config, path), std::nullopt);

    const auto loaded = load_config(path);
    EXPECT_EQ(loaded.archive_path, "/mnt/backup/drive");
    EXPECT_EQ(loaded.rules.filter_mode, filter_mode_t::Date);
    EXPECT_EQ(loaded.rules.before_date, "2021-06-30");
    EXPECT_FALSE(loaded.rules.trash_after);
    EXPECT_NE(dump_config(config).find("\n  \"archive\""), std::string::npos);
}

TEST(config_test, rule_set_size_mode) {
    const auto rules = make_rule_set(default_config());
    EXPECT_EQ(rules.min_size_mb, 200);
    EXPECT_EQ(rules.before_date, std::nullopt);
    EXPECT_EQ(rules.filter_mode, filter_mode_t::Size);
    EXPECT_TRUE(rules.include_google_docs);
}

TEST(config_test, rule_set_date_mode) {
    auto config = default_config();
    config.rules.filter_mode = filter_mode_t::Date;
    auto rules = make_rule_set(config);
    EXPECT_EQ(rules.min_size_mb, 0);
    EXPECT_EQ(rules.before_date, "2020-01-01");

    config.rules.before_date = "";
    rules = make_rule_set(config);
    EXPECT_EQ(rules.before_date, std::nullopt);
}

TEST(config_test, validate_archive_root) {
    const auto dir = make_tmp_dir("config_root");
    EXPECT_TRUE(validate_archive_root("").has_value());
    EXPECT_EQ(validate_archive_root((dir / "archive").string()), std::nullopt);
    EXPECT_EQ(validate_archive_root((dir / "archive").string() + "/"), std::nullopt);
    EXPECT_TRUE(validate_archive_root((dir / "missing" / "archive").string()).has_value());
}

TEST(config_test, config_dir_from_environment) {
    setenv(CONFIG_DIR_ENV, "/tmp/drive-archiver-test-config", 1);
    EXPECT_EQ(config_dir(), std::filesystem::path("/tmp/drive-archiver-test-config"));
    unsetenv(CONFIG_DIR_ENV);
}
