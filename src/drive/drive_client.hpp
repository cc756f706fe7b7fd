#pragma once

#include <string>
#include <variant>

#include "../remote/remote_source.hpp"

#define PART_FILE_SUFFIX ".part"
#define ACCESS_TOKEN_ENV "DRIVE_ARCHIVER_ACCESS_TOKEN"

struct access_token_t {
    std::string token;
};

// reads "access_token" from an OAuth token JSON file
std::variant<access_token_t, std::string> load_access_token(const std::string &path);

// Google Drive v3 over HTTPS. Authorization is done elsewhere, the client only
// carries a bearer token.
class DriveClient : public RemoteFileSource {
public:
    explicit DriveClient(const std::string &access_token_);

    std::variant<account_info_t, std::string> connect() override;
    std::variant<remote_page_t, std::string> list_page(const page_query_t &query) override;
    std::variant<std::filesystem::path, std::string> download(
        const std::string &file_id,
        const std::string &mime_type,
        const std::filesystem::path &destination,
        const transfer_progress_t &on_progress) override;
    std::optional<std::string> trash(const std::string &file_id) override;

private:
    std::vector<std::string> auth_headers() const;

    const std::string access_token;
};
