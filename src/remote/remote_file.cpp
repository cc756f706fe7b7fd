#include <unordered_map>
#include <unordered_set>

#include "./remote_file.hpp"

static const std::unordered_map<std::string, export_format_t> &export_formats() {
    static const std::unordered_map<std::string, export_format_t> formats = {
        {"application/vnd.google-apps.document", {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", ".docx"}},
        {"application/vnd.google-apps.spreadsheet", {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", ".xlsx"}},
        {"application/vnd.google-apps.presentation", {"application/vnd.openxmlformats-officedocument.presentationml.presentation", ".pptx"}},
        {"application/vnd.google-apps.drawing", {"image/png", ".png"}},
    };
    return formats;
}

bool is_virtual_document(const std::string &mime_type) {
    return export_formats().count(mime_type) > 0;
}

bool is_skipped_type(const std::string &mime_type) {
    static const std::unordered_set<std::string> skipped = {
        "application/vnd.google-apps.shortcut",
        "application/vnd.google-apps.form",
        "application/vnd.google-apps.map",
        "application/vnd.google-apps.site",
        FOLDER_MIME_TYPE,
    };
    return skipped.count(mime_type) > 0;
}

std::optional<export_format_t> export_format_for(const std::string &mime_type) {
    const auto &formats = export_formats();
    const auto it = formats.find(mime_type);
    if (it == formats.end()) {
        return std::nullopt;
    }
    return it->second;
}
