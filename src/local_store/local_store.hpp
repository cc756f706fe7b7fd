#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#define TEMP_FILE_SUFFIX ".tmp"

// Local side of an archive run. All operations report failures as an error
// string instead of throwing.
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual std::optional<std::string> ensure_dir(const std::filesystem::path &path) = 0;
    // never leaves a partially written file at path
    virtual std::optional<std::string> atomic_write(const std::filesystem::path &path, const std::string &bytes) = 0;
    virtual bool exists(const std::filesystem::path &path) const = 0;
    virtual std::optional<unsigned long long> file_size(const std::filesystem::path &path) const = 0;
    // free bytes on the volume holding path or its nearest existing ancestor
    virtual std::variant<unsigned long long, std::string> free_space(const std::filesystem::path &path) const = 0;
    virtual std::optional<std::string> remove(const std::filesystem::path &path) = 0;
};

class FilesystemStore : public LocalStore {
public:
    std::optional<std::string> ensure_dir(const std::filesystem::path &path) override;
    std::optional<std::string> atomic_write(const std::filesystem::path &path, const std::string &bytes) override;
    bool exists(const std::filesystem::path &path) const override;
    std::optional<unsigned long long> file_size(const std::filesystem::path &path) const override;
    std::variant<unsigned long long, std::string> free_space(const std::filesystem::path &path) const override;
    std::optional<std::string> remove(const std::filesystem::path &path) override;
};

// sibling used while a file is being written: "a/b.jpg" -> "a/b.jpg.tmp"
std::filesystem::path temp_sibling(const std::filesystem::path &path, const std::string &suffix = TEMP_FILE_SUFFIX);
