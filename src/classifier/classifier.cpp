#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

#include "./classifier.hpp"

struct category_extensions_t {
    category_t category;
    std::vector<std::string> extensions;
};

static const std::vector<category_extensions_t> &category_definitions() {
    static const std::vector<category_extensions_t> definitions = {
        {category_t::Photos, {"jpg", "jpeg", "png", "heic", "webp", "gif", "bmp", "tiff", "tif", "raw", "cr2", "nef"}},
        {category_t::Videos, {"mp4", "mkv", "mov", "avi", "webm", "wmv", "flv", "m4v", "3gp"}},
        {category_t::Audio, {"mp3", "wav", "flac", "m4a", "aac", "ogg", "wma", "aiff"}},
        {category_t::Documents, {"pdf", "docx", "doc", "xlsx", "xls", "pptx", "ppt", "txt", "rtf", "odt", "ods", "odp"}},
        {category_t::Archives, {"zip", "rar", "7z", "tar", "gz", "bz2", "xz", "tgz"}},
        {category_t::Installers, {"exe", "msi", "dmg", "pkg", "deb", "rpm", "appimage"}},
    };
    return definitions;
}

static std::unordered_map<std::string, category_t> build_extension_table() {
    std::unordered_map<std::string, category_t> table;
    for (const auto &d : category_definitions()) {
        for (const auto &ext : d.extensions) {
            table[ext] = d.category;
        }
    }
    return table;
}

static const std::unordered_map<std::string, category_t> &extension_table() {
    static const auto table = build_extension_table();
    return table;
}

static const std::unordered_map<std::string, category_t> &mime_table() {
    static const std::unordered_map<std::string, category_t> table = {
        {"image/jpeg", category_t::Photos},
        {"image/png", category_t::Photos},
        {"image/gif", category_t::Photos},
        {"image/webp", category_t::Photos},
        {"image/heic", category_t::Photos},
        {"image/heif", category_t::Photos},
        {"image/bmp", category_t::Photos},
        {"image/tiff", category_t::Photos},

        {"video/mp4", category_t::Videos},
        {"video/x-matroska", category_t::Videos},
        {"video/quicktime", category_t::Videos},
        {"video/x-msvideo", category_t::Videos},
        {"video/webm", category_t::Videos},
        {"video/x-ms-wmv", category_t::Videos},
        {"video/x-flv", category_t::Videos},

        {"audio/mpeg", category_t::Audio},
        {"audio/mp3", category_t::Audio},
        {"audio/wav", category_t::Audio},
        {"audio/x-wav", category_t::Audio},
        {"audio/flac", category_t::Audio},
        {"audio/x-flac", category_t::Audio},
        {"audio/mp4", category_t::Audio},
        {"audio/aac", category_t::Audio},
        {"audio/ogg", category_t::Audio},

        {"application/pdf", category_t::Documents},
        {"application/msword", category_t::Documents},
        {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", category_t::Documents},
        {"application/vnd.ms-excel", category_t::Documents},
        {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", category_t::Documents},
        {"application/vnd.ms-powerpoint", category_t::Documents},
        {"application/vnd.openxmlformats-officedocument.presentationml.presentation", category_t::Documents},
        {"text/plain", category_t::Documents},
        // virtual documents are exported as office formats
        {"application/vnd.google-apps.document", category_t::Documents},
        {"application/vnd.google-apps.spreadsheet", category_t::Documents},
        {"application/vnd.google-apps.presentation", category_t::Documents},

        {"application/zip", category_t::Archives},
        {"application/x-rar-compressed", category_t::Archives},
        {"application/x-7z-compressed", category_t::Archives},
        {"application/x-tar", category_t::Archives},
        {"application/gzip", category_t::Archives},

        {"application/x-msdownload", category_t::Installers},
        {"application/x-msi", category_t::Installers},
    };
    return table;
}

std::string file_extension(const std::string &file_name) {
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "";
    }
    auto ext = file_name.substr(dot + 1);
    // "dir.d/file" has no extension
    if (ext.find_first_of("/\\") != std::string::npos) {
        return "";
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char) std::tolower(c); });
    return ext;
}

category_t classify_file(const std::string &file_name, const std::string &mime_type) {
    if (!mime_type.empty()) {
        const auto &mimes = mime_table();
        const auto it = mimes.find(mime_type);
        if (it != mimes.end()) {
            return it->second;
        }
    }

    const auto ext = file_extension(file_name);
    if (!ext.empty()) {
        const auto &extensions = extension_table();
        const auto it = extensions.find(ext);
        if (it != extensions.end()) {
            return it->second;
        }
    }
    return category_t::Other;
}

const char *category_name(category_t category) {
    switch (category) {
    case category_t::Photos:
        return "Photos";
    case category_t::Videos:
        return "Videos";
    case category_t::Audio:
        return "Audio";
    case category_t::Documents:
        return "Documents";
    case category_t::Archives:
        return "Archives";
    case category_t::Installers:
        return "Installers";
    case category_t::Other:
        return "Other";
    }
    return "Other";
}

const std::vector<category_t> &all_categories() {
    static const std::vector<category_t> categories = {
        category_t::Photos,
        category_t::Videos,
        category_t::Audio,
        category_t::Documents,
        category_t::Archives,
        category_t::Installers,
        category_t::Other,
    };
    return categories;
}

bool is_date_bucketed(category_t category) {
    return category == category_t::Photos || category == category_t::Videos || category == category_t::Documents;
}
