#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

struct http_response_t {
    long status_code;
    std::string body;
};

// (bytes so far, total bytes)
typedef std::function<void(unsigned long long, unsigned long long)> http_progress_t;

// call once per process before any request
void http_global_init();
void http_global_cleanup();

// transport errors are returned as a string; HTTP error codes come back in the response
std::variant<http_response_t, std::string> http_request(
    const std::string &method,
    const std::string &url,
    const std::vector<std::string> &headers,
    const std::string &body = "");

// streams the response body into output_path. On HTTP errors the body is returned
// in the response and nothing is written.
std::variant<http_response_t, std::string> http_download(
    const std::string &url,
    const std::vector<std::string> &headers,
    const std::filesystem::path &output_path,
    const http_progress_t &on_progress);
