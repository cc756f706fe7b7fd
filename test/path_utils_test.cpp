#include <set>
#include <gtest/gtest.h>

#include "../src/path/path_utils.hpp"

TEST(path_utils_test, clean_file_name) {
    EXPECT_EQ(clean_file_name("report.pdf"), "report.pdf");
    EXPECT_EQ(clean_file_name("a<b>c:d\"e/f\\g|h?i*j"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(clean_file_name("  .hidden name.  "), "hidden name");
    EXPECT_EQ(clean_file_name("tab\there"), "tab_here");
    EXPECT_EQ(clean_file_name(" . . "), UNNAMED_FILE_NAME);
    EXPECT_EQ(clean_file_name(""), UNNAMED_FILE_NAME);
}

TEST(path_utils_test, parse_drive_date) {
    const auto date = parse_drive_date("2024-01-15T10:30:00.000Z");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year, 2024);
    EXPECT_EQ(date->month, 1);
    EXPECT_EQ(date->day, 15);
    EXPECT_TRUE(parse_drive_date("2024-01-15").has_value());
    EXPECT_FALSE(parse_drive_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_drive_date("2024-1-15").has_value());
    EXPECT_FALSE(parse_drive_date("2024-01-15X").has_value());
    EXPECT_FALSE(parse_drive_date("yesterday").has_value());
}

TEST(path_utils_test, plan_date_bucketed) {
    const auto path = plan_local_path("/archive", "photo.jpg", "image/jpeg", drive_date_t { 2024, 1, 15 });
    EXPECT_EQ(path, std::filesystem::path("/archive/Photos/2024/2024-01/photo.jpg"));
}

TEST(path_utils_test, plan_without_date) {
    EXPECT_EQ(plan_local_path("/archive", "photo.jpg", "", std::nullopt), std::filesystem::path("/archive/Photos/photo.jpg"));
    EXPECT_EQ(plan_local_path("/archive", "song.mp3", "audio/mpeg", drive_date_t { 2021, 7, 3 }), std::filesystem::path("/archive/Audio/song.mp3"));
    EXPECT_EQ(plan_local_path("/archive", "blob.bin", "", drive_date_t { 2021, 7, 3 }), std::filesystem::path("/archive/Other/blob.bin"));
}

TEST(path_utils_test, unique_path_free) {
    const auto path = unique_path("/archive/Other/report.pdf", [](const std::filesystem::path &) { return false; });
    EXPECT_EQ(path, std::filesystem::path("/archive/Other/report.pdf"));
}

TEST(path_utils_test, unique_path_collisions) {
    const std::set<std::filesystem::path> taken = {
        "/archive/Other/report.pdf",
        "/archive/Other/report (1).pdf",
    };
    const auto path = unique_path("/archive/Other/report.pdf", [&taken](const std::filesystem::path &p) { return taken.count(p) > 0; });
    EXPECT_EQ(path, std::filesystem::path("/archive/Other/report (2).pdf"));
}

TEST(path_utils_test, unique_path_without_extension) {
    const std::set<std::filesystem::path> taken = { "/archive/Other/notes" };
    const auto path = unique_path("/archive/Other/notes", [&taken](const std::filesystem::path &p) { return taken.count(p) > 0; });
    EXPECT_EQ(path, std::filesystem::path("/archive/Other/notes (1)"));
}

TEST(path_utils_test, replace_extension) {
    EXPECT_EQ(replace_extension("/a/Budget", ".xlsx"), std::filesystem::path("/a/Budget.xlsx"));
    EXPECT_EQ(replace_extension("/a/report.gdoc", ".docx"), std::filesystem::path("/a/report.docx"));
}
