#include <fstream>
#include <sstream>
#include <gtest/gtest.h>

#include "../src/drive/drive_api.hpp"
#include "../src/drive/drive_client.hpp"
#include "test_utils.hpp"

static std::string read_asset(const std::string &name) {
    std::ifstream stream(get_asset(name));
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

TEST(drive_api_test, parse_file_list) {
    const auto body = read_asset("files_page.json");
    ASSERT_FALSE(body.empty());
    const auto ret = parse_file_list(body);
    ASSERT_TRUE(std::holds_alternative<remote_page_t>(ret));
    const auto &page = std::get<remote_page_t>(ret);
    EXPECT_EQ(page.next_page_token, "token-2");
    ASSERT_EQ(page.files.size(), 3);

    EXPECT_EQ(page.files[0].id, "1a");
    EXPECT_EQ(page.files[0].name, "holiday.mp4");
    EXPECT_EQ(page.files[0].size, 314572800ULL);
    EXPECT_EQ(page.files[0].mime_type, "video/mp4");
    EXPECT_EQ(page.files[0].modified_time, "2019-08-02T09:15:00.000Z");
    ASSERT_EQ(page.files[0].parents.size(), 1);
    EXPECT_EQ(page.files[0].parents[0], "root");

    // virtual documents come without a size
    EXPECT_EQ(page.files[1].size, 0);
    EXPECT_EQ(page.files[1].parents.size(), 0);

    EXPECT_EQ(page.files[2].size, 0);
    EXPECT_EQ(page.files[2].modified_time, std::nullopt);
}

TEST(drive_api_test, parse_last_page) {
    const auto ret = parse_file_list("{\"files\": []}");
    ASSERT_TRUE(std::holds_alternative<remote_page_t>(ret));
    EXPECT_EQ(std::get<remote_page_t>(ret).files.size(), 0);
    EXPECT_EQ(std::get<remote_page_t>(ret).next_page_token, std::nullopt);
}

TEST(drive_api_test, parse_invalid) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_file_list("<html>")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_file_list("[1, 2]")));
}

TEST(drive_api_test, list_url) {
    const auto url = build_list_url(page_query_t { 100, std::nullopt });
    EXPECT_EQ(url.find("https://www.googleapis.com/drive/v3/files?q="), 0);
    EXPECT_NE(url.find("q=%27me%27%20in%20owners%20and%20trashed%20%3D%20false"), std::string::npos);
    EXPECT_NE(url.find("pageSize=100"), std::string::npos);
    EXPECT_NE(url.find("orderBy=modifiedTime%20desc"), std::string::npos);
    EXPECT_EQ(url.find("pageToken"), std::string::npos);

    const auto next = build_list_url(page_query_t { 5000, std::string("abc/=") });
    EXPECT_NE(next.find("pageSize=1000"), std::string::npos);
    EXPECT_NE(next.find("&pageToken=abc%2F%3D"), std::string::npos);
}

TEST(drive_api_test, file_urls) {
    EXPECT_EQ(build_media_url("1a"), "https://www.googleapis.com/drive/v3/files/1a?alt=media");
    EXPECT_EQ(build_export_url("2b", "image/png"), "https://www.googleapis.com/drive/v3/files/2b/export?mimeType=image%2Fpng");
    EXPECT_EQ(build_about_url(), "https://www.googleapis.com/drive/v3/about?fields=user");
}

TEST(drive_api_test, parse_about) {
    const auto ret = parse_about("{\"user\": {\"emailAddress\": \"me@example.com\"}}");
    ASSERT_TRUE(std::holds_alternative<account_info_t>(ret));
    EXPECT_EQ(std::get<account_info_t>(ret).email, "me@example.com");
    const auto unknown = parse_about("{}");
    ASSERT_TRUE(std::holds_alternative<account_info_t>(unknown));
    EXPECT_EQ(std::get<account_info_t>(unknown).email, "Unknown");
}

TEST(drive_api_test, http_errors) {
    const auto body = "{\"error\": {\"code\": 401, \"message\": \"Invalid Credentials\"}}";
    EXPECT_EQ(describe_http_error(401, body), "Authorization failed (HTTP 401): Invalid Credentials");
    EXPECT_EQ(describe_http_error(404, "{\"error\": \"not found\"}"), "HTTP 404: not found");
    EXPECT_EQ(describe_http_error(500, "oops"), "HTTP 500: oops");
    EXPECT_EQ(describe_http_error(502, ""), "HTTP 502: no details");
}

TEST(drive_api_test, load_access_token) {
    const auto dir = make_tmp_dir("drive_token");
    const auto token_path = dir / "token.json";
    std::ofstream(token_path) << "{\"access_token\": \"ya29.test\", \"expires_in\": 3599}";
    const auto ret = load_access_token(token_path.string());
    ASSERT_TRUE(std::holds_alternative<access_token_t>(ret));
    EXPECT_EQ(std::get<access_token_t>(ret).token, "ya29.test");

    EXPECT_TRUE(std::holds_alternative<std::string>(load_access_token((dir / "missing.json").string())));
}

TEST(drive_api_test, connect_without_token) {
    DriveClient client("");
    EXPECT_TRUE(std::holds_alternative<std::string>(client.connect()));
}
