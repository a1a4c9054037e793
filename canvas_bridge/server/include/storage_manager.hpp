#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace canvas::server {

// Local download tree: <root>/<course_id>/<relative_path>.
class StorageManager {
public:
    explicit StorageManager(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path course_root(const std::string& course_id) const;
    std::filesystem::path resolve(const std::string& course_id, const std::filesystem::path& relative) const;

    bool exists(const std::string& course_id, const std::filesystem::path& relative) const;

    // Writes to a ".part" sibling and renames it into place, so a crash never
    // leaves a truncated file under the final name. Throws on I/O failure.
    std::filesystem::path write_file(const std::string& course_id,
                                     const std::filesystem::path& relative,
                                     std::string_view contents);

    std::uint64_t file_size(const std::filesystem::path& absolute_path) const;

    static std::string sanitize_filename(std::string_view name);

private:
    std::filesystem::path sanitize_path(const std::filesystem::path& base, const std::filesystem::path& relative) const;

    std::filesystem::path root_;
};

}  // namespace canvas::server
