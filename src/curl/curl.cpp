#include <fstream>

#include <curl/curl.h>

#include "./curl.hpp"

#define CONNECT_TIMEOUT_SECONDS 30
// abort transfers slower than 1 byte/s for this long
#define LOW_SPEED_TIME_SECONDS 120

struct download_state_t {
    CURL *curl;
    std::ofstream *stream;
    std::string error_body;
    bool write_failed;
    const http_progress_t *on_progress;
};

static size_t write_buffer_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto& mem = *static_cast<std::string*>(userp);
    mem.append(static_cast<char*>(contents), realsize);
    return realsize;
}

static size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto &state = *static_cast<download_state_t*>(userp);
    long status_code = 0;
    curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status_code);
    if (status_code >= 400) {
        state.error_body.append(static_cast<char*>(contents), realsize);
        return realsize;
    }
    state.stream->write(static_cast<char*>(contents), (std::streamsize) realsize);
    if (!*state.stream) {
        state.write_failed = true;
        return 0;
    }
    return realsize;
}

static int progress_callback(void* userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto &state = *static_cast<download_state_t*>(userp);
    if (state.on_progress != nullptr && *state.on_progress && dlnow > 0) {
        (*state.on_progress)((unsigned long long) dlnow, (unsigned long long) dltotal);
    }
    return 0;
}

static curl_slist *make_header_list(const std::vector<std::string> &headers) {
    curl_slist *list = nullptr;
    for (const auto &h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    return list;
}

static void set_common_options(CURL *curl, const std::string &url, curl_slist *headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, (long) CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, (long) LOW_SPEED_TIME_SECONDS);
}

void http_global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void http_global_cleanup() {
    curl_global_cleanup();
}

std::variant<http_response_t, std::string> http_request(
    const std::string &method,
    const std::string &url,
    const std::vector<std::string> &headers,
    const std::string &body) {
    auto curl = curl_easy_init();
    if (curl == nullptr) {
        return std::string("Cannot start Curl");
    }

    auto header_list = make_header_list(headers);
    std::string data;
    set_common_options(curl, url, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_buffer_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);
    if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (!body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long) body.size());
    }

    const auto res = curl_easy_perform(curl);
    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::string("Request with Curl error: ") + std::string(curl_easy_strerror(res));
    }
    return http_response_t { status_code, data };
}

std::variant<http_response_t, std::string> http_download(
    const std::string &url,
    const std::vector<std::string> &headers,
    const std::filesystem::path &output_path,
    const http_progress_t &on_progress) {
    std::ofstream stream(output_path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return std::string("Could not open \"") + output_path.u8string() + "\" for writing";
    }

    auto curl = curl_easy_init();
    if (curl == nullptr) {
        return std::string("Cannot start Curl");
    }

    download_state_t state { curl, &stream, "", false, &on_progress };
    auto header_list = make_header_list(headers);
    set_common_options(curl, url, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_file_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    const auto res = curl_easy_perform(curl);
    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    stream.close();

    if (state.write_failed || stream.fail()) {
        return std::string("Failed to write \"") + output_path.u8string() + "\"";
    }
    if (res != CURLE_OK) {
        return std::string("Download with Curl error: ") + std::string(curl_easy_strerror(res));
    }
    if (status_code >= 400) {
        return http_response_t { status_code, state.error_body };
    }
    return http_response_t { status_code, "" };
}
