#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Snapshot of one remote file as reported by the listing. Populated once at the
// remote source boundary, never modified afterwards.
struct remote_file_t {
    std::string id;
    std::string name;
    uint64_t size;
    std::string mime_type;
    // RFC 3339 timestamp, e.g. 2024-01-15T10:30:00.000Z
    std::optional<std::string> modified_time;
    std::vector<std::string> parents;
};

struct export_format_t {
    std::string mime_type;
    std::string extension;
};

#define FOLDER_MIME_TYPE "application/vnd.google-apps.folder"

// remote-native documents: reported with size 0, content only exists after export
bool is_virtual_document(const std::string &mime_type);

// folders, shortcuts, forms, maps and sites carry no archivable content
bool is_skipped_type(const std::string &mime_type);

// export target for a virtual document, std::nullopt for ordinary files
std::optional<export_format_t> export_format_for(const std::string &mime_type);
