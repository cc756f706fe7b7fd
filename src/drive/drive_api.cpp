#include <algorithm>
#include <cctype>
#include <cstdio>

#include <nlohmann/json.hpp>

#include "./drive_api.hpp"

std::string url_encode(const std::string &value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string ret;
    ret.reserve(value.size() * 3);
    for (const auto ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ret += (char) c;
            continue;
        }
        ret += '%';
        ret += hex[c >> 4];
        ret += hex[c & 0x0F];
    }
    return ret;
}

std::string build_list_url(const page_query_t &query) {
    const auto page_size = std::min<unsigned int>(std::max<unsigned int>(query.page_size, 1), MAX_PAGE_SIZE);
    auto url = std::string(DRIVE_API_URL) + "/files"
        + "?q=" + url_encode(DRIVE_LIST_QUERY)
        + "&pageSize=" + std::to_string(page_size)
        + "&fields=" + url_encode(DRIVE_LIST_FIELDS)
        + "&orderBy=" + url_encode("modifiedTime desc");
    if (query.page_token.has_value() && !query.page_token->empty()) {
        url += "&pageToken=" + url_encode(query.page_token.value());
    }
    return url;
}

std::string build_media_url(const std::string &file_id) {
    return build_file_url(file_id) + "?alt=media";
}

std::string build_export_url(const std::string &file_id, const std::string &export_mime_type) {
    return build_file_url(file_id) + "/export?mimeType=" + url_encode(export_mime_type);
}

std::string build_file_url(const std::string &file_id) {
    return std::string(DRIVE_API_URL) + "/files/" + url_encode(file_id);
}

std::string build_about_url() {
    return std::string(DRIVE_API_URL) + "/about?fields=user";
}

static std::string string_field(const nlohmann::json &object, const char *key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Drive sends int64 values as decimal strings
static uint64_t size_field(const nlohmann::json &object) {
    const auto it = object.find("size");
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (!it->is_string()) {
        return 0;
    }
    const auto &value = it->get_ref<const std::string &>();
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return 0;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception &) {
        return 0;
    }
}

static remote_file_t to_remote_file(const nlohmann::json &object) {
    remote_file_t file;
    file.id = string_field(object, "id");
    file.name = string_field(object, "name");
    file.size = size_field(object);
    file.mime_type = string_field(object, "mimeType");
    const auto modified = string_field(object, "modifiedTime");
    if (!modified.empty()) {
        file.modified_time = modified;
    }
    const auto parents = object.find("parents");
    if (parents != object.end() && parents->is_array()) {
        for (const auto &p : *parents) {
            if (p.is_string()) {
                file.parents.push_back(p.get<std::string>());
            }
        }
    }
    return file;
}

std::variant<remote_page_t, std::string> parse_file_list(const std::string &body) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        return std::string("Invalid file list response: ") + e.what();
    }
    if (!json.is_object()) {
        return std::string("Invalid file list response: not an object");
    }

    remote_page_t page;
    const auto files = json.find("files");
    if (files != json.end() && files->is_array()) {
        for (const auto &f : *files) {
            if (!f.is_object()) {
                continue;
            }
            auto file = to_remote_file(f);
            if (file.id.empty()) {
                continue;
            }
            page.files.push_back(std::move(file));
        }
    }
    const auto token = string_field(json, "nextPageToken");
    if (!token.empty()) {
        page.next_page_token = token;
    }
    return page;
}

std::variant<account_info_t, std::string> parse_about(const std::string &body) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        return std::string("Invalid account response: ") + e.what();
    }
    account_info_t account {"Unknown"};
    const auto user = json.find("user");
    if (user != json.end() && user->is_object()) {
        const auto email = string_field(*user, "emailAddress");
        if (!email.empty()) {
            account.email = email;
        }
    }
    return account;
}

std::string parse_error_message(const std::string &body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return body;
    }
    const auto error = json.find("error");
    if (error == json.end()) {
        return body;
    }
    if (error->is_string()) {
        return error->get<std::string>();
    }
    if (error->is_object()) {
        const auto message = string_field(*error, "message");
        if (!message.empty()) {
            return message;
        }
    }
    return body;
}

std::string describe_http_error(long status_code, const std::string &body) {
    auto message = parse_error_message(body);
    if (message.empty()) {
        message = "no details";
    }
    if (status_code == 401 || status_code == 403) {
        return std::string("Authorization failed (HTTP ") + std::to_string(status_code) + "): " + message;
    }
    return std::string("HTTP ") + std::to_string(status_code) + ": " + message;
}
