#include <fstream>

#include "./local_store.hpp"

std::filesystem::path temp_sibling(const std::filesystem::path &path, const std::string &suffix) {
    auto ret = path;
    ret += suffix;
    return ret;
}

std::optional<std::string> FilesystemStore::ensure_dir(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::string("Could not create directory \"") + path.u8string() + "\": " + ec.message();
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return std::string("Not a directory: \"") + path.u8string() + "\"";
    }
    return std::nullopt;
}

std::optional<std::string> FilesystemStore::atomic_write(const std::filesystem::path &path, const std::string &bytes) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        const auto dir_ret = ensure_dir(parent);
        if (dir_ret.has_value()) {
            return dir_ret;
        }
    }

    const auto temp_path = temp_sibling(path);
    {
        std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return std::string("Could not open \"") + temp_path.u8string() + "\" for writing";
        }
        stream.write(bytes.data(), (std::streamsize) bytes.size());
        stream.flush();
        if (!stream) {
            stream.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return std::string("Failed to write file \"") + temp_path.u8string() + "\"";
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return std::string("Failed to write file \"") + path.u8string() + "\": " + ec.message();
    }
    return std::nullopt;
}

bool FilesystemStore::exists(const std::filesystem::path &path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<unsigned long long> FilesystemStore::file_size(const std::filesystem::path &path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return (unsigned long long) size;
}

std::variant<unsigned long long, std::string> FilesystemStore::free_space(const std::filesystem::path &path) const {
    std::error_code ec;
    // "archive" has no parent to walk up to, "/cwd/archive" does
    auto target = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::string("Could not get disk space: ") + ec.message();
    }
    while (!std::filesystem::exists(target, ec) && target.has_parent_path() && target.parent_path() != target) {
        target = target.parent_path();
    }
    const auto info = std::filesystem::space(target, ec);
    if (ec) {
        return std::string("Could not get disk space: ") + ec.message();
    }
    return (unsigned long long) info.available;
}

std::optional<std::string> FilesystemStore::remove(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::string("Could not remove \"") + path.u8string() + "\": " + ec.message();
    }
    return std::nullopt;
}
