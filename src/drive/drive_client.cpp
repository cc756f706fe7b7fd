#include <fstream>

#include <nlohmann/json.hpp>

#include "../curl/curl.hpp"
#include "../local_store/local_store.hpp"
#include "../path/path_utils.hpp"
#include "./drive_api.hpp"
#include "./drive_client.hpp"

std::variant<access_token_t, std::string> load_access_token(const std::string &path) {
    std::ifstream stream(std::filesystem::u8path(path));
    if (!stream) {
        return std::string("Token file \"") + path + "\" is not found";
    }
    const auto json = nlohmann::json::parse(stream, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::string("Token file \"") + path + "\" is not valid JSON";
    }
    for (const auto key : {"access_token", "token"}) {
        const auto it = json.find(key);
        if (it != json.end() && it->is_string() && !it->get<std::string>().empty()) {
            return access_token_t { it->get<std::string>() };
        }
    }
    return std::string("Token file \"") + path + "\" has no access token";
}

DriveClient::DriveClient(const std::string &access_token_) :
    access_token {access_token_} {}

std::vector<std::string> DriveClient::auth_headers() const {
    return { std::string("Authorization: Bearer ") + access_token };
}

std::variant<account_info_t, std::string> DriveClient::connect() {
    if (access_token.empty()) {
        return std::string("Not connected to Google Drive: access token is missing");
    }
    const auto ret = http_request("GET", build_about_url(), auth_headers());
    if (std::holds_alternative<std::string>(ret)) {
        return std::string("Could not connect to Google Drive: ") + std::get<std::string>(ret);
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status_code >= 400) {
        return std::string("Could not connect to Google Drive: ") + describe_http_error(response.status_code, response.body);
    }
    return parse_about(response.body);
}

std::variant<remote_page_t, std::string> DriveClient::list_page(const page_query_t &query) {
    const auto ret = http_request("GET", build_list_url(query), auth_headers());
    if (std::holds_alternative<std::string>(ret)) {
        return std::string("Failed to list files: ") + std::get<std::string>(ret);
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status_code >= 400) {
        return std::string("Failed to list files: ") + describe_http_error(response.status_code, response.body);
    }
    return parse_file_list(response.body);
}

std::variant<std::filesystem::path, std::string> DriveClient::download(
    const std::string &file_id,
    const std::string &mime_type,
    const std::filesystem::path &destination,
    const transfer_progress_t &on_progress) {
    auto actual_path = destination;
    auto url = build_media_url(file_id);
    std::string what = "download";
    const auto export_format = export_format_for(mime_type);
    if (export_format.has_value()) {
        actual_path = replace_extension(destination, export_format->extension);
        url = build_export_url(file_id, export_format->mime_type);
        what = "export";
    }

    std::error_code ec;
    std::filesystem::create_directories(actual_path.parent_path(), ec);
    if (ec) {
        return std::string("Failed to ") + what + " file: " + ec.message();
    }

    const auto part_path = temp_sibling(actual_path, PART_FILE_SUFFIX);
    const auto ret = http_download(url, auth_headers(), part_path, on_progress);
    if (std::holds_alternative<std::string>(ret)) {
        std::filesystem::remove(part_path, ec);
        return std::string("Failed to ") + what + " file: " + std::get<std::string>(ret);
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status_code >= 400) {
        std::filesystem::remove(part_path, ec);
        return std::string("Failed to ") + what + " file: " + describe_http_error(response.status_code, response.body);
    }

    std::filesystem::rename(part_path, actual_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(part_path, ignored);
        return std::string("Failed to ") + what + " file: " + ec.message();
    }
    return actual_path;
}

std::optional<std::string> DriveClient::trash(const std::string &file_id) {
    auto headers = auth_headers();
    headers.push_back("Content-Type: application/json");
    const nlohmann::json body = {{"trashed", true}};
    const auto ret = http_request("PATCH", build_file_url(file_id), headers, body.dump());
    if (std::holds_alternative<std::string>(ret)) {
        return std::string("Failed to trash file: ") + std::get<std::string>(ret);
    }
    const auto &response = std::get<http_response_t>(ret);
    if (response.status_code >= 400) {
        return std::string("Failed to trash file: ") + describe_http_error(response.status_code, response.body);
    }
    return std::nullopt;
}
