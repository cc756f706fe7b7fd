#pragma once

#include <string>
#include <variant>

#include "../remote/remote_source.hpp"

#define DRIVE_API_URL "https://www.googleapis.com/drive/v3"
#define DRIVE_LIST_QUERY "'me' in owners and trashed = false"
#define DRIVE_LIST_FIELDS "nextPageToken,files(id,name,size,mimeType,modifiedTime,parents)"

// Request building and response parsing for Drive v3, kept apart from the
// transport so it can be checked without network access.

std::string url_encode(const std::string &value);

std::string build_list_url(const page_query_t &query);
std::string build_media_url(const std::string &file_id);
std::string build_export_url(const std::string &file_id, const std::string &export_mime_type);
std::string build_file_url(const std::string &file_id);
std::string build_about_url();

// turns a files.list response body into fixed-shape records
std::variant<remote_page_t, std::string> parse_file_list(const std::string &body);

std::variant<account_info_t, std::string> parse_about(const std::string &body);

// "error.message" from a Drive error body, or the raw body when it is not JSON
std::string parse_error_message(const std::string &body);

// readable error for a failed HTTP exchange
std::string describe_http_error(long status_code, const std::string &body);
