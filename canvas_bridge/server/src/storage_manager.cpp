#include "storage_manager.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace canvas::server {

namespace {
constexpr std::string_view kIllegalChars = "<>:\"/\\|?*";
constexpr std::size_t kMaxNameLength = 200;

void write_all(int fd, std::string_view contents, const std::filesystem::path& path) {
    std::size_t written = 0;
    while (written < contents.size()) {
        const ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Write failed for " + path.string() + ": " + std::strerror(errno));
        }
        written += static_cast<std::size_t>(n);
    }
}
}  // namespace

StorageManager::StorageManager(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::string StorageManager::sanitize_filename(std::string_view name) {
    std::string cleaned(name);
    for (char& ch : cleaned) {
        if (kIllegalChars.find(ch) != std::string_view::npos || static_cast<unsigned char>(ch) < 0x20) {
            ch = '_';
        }
    }
    const auto first = cleaned.find_first_not_of(". ");
    if (first == std::string::npos) {
        return "unnamed";
    }
    const auto last = cleaned.find_last_not_of(". ");
    cleaned = cleaned.substr(first, last - first + 1);
    if (cleaned.size() > kMaxNameLength) {
        cleaned.resize(kMaxNameLength);
    }
    return cleaned.empty() ? std::string("unnamed") : cleaned;
}

std::filesystem::path StorageManager::course_root(const std::string& course_id) const {
    auto path = root_ / sanitize_filename(course_id);
    std::filesystem::create_directories(path);
    return path;
}

std::filesystem::path StorageManager::sanitize_path(const std::filesystem::path& base,
                                                    const std::filesystem::path& relative) const {
    if (relative.is_absolute()) {
        throw std::runtime_error("Absolute path rejected: " + relative.string());
    }
    const auto canonical_base = std::filesystem::weakly_canonical(base);
    const auto canonical_target = std::filesystem::weakly_canonical(base / relative);
    const auto rel = canonical_target.lexically_relative(canonical_base);
    if (rel.empty() || *rel.begin() == "..") {
        throw std::runtime_error("Path traversal detected");
    }
    return canonical_target;
}

std::filesystem::path StorageManager::resolve(const std::string& course_id,
                                              const std::filesystem::path& relative) const {
    return sanitize_path(course_root(course_id), relative);
}

bool StorageManager::exists(const std::string& course_id, const std::filesystem::path& relative) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(course_id, relative), ec);
}

std::filesystem::path StorageManager::write_file(const std::string& course_id,
                                                 const std::filesystem::path& relative,
                                                 std::string_view contents) {
    const auto final_path = resolve(course_id, relative);
    std::filesystem::create_directories(final_path.parent_path());
    auto temp_path = final_path;
    temp_path += ".part";

    const int fd = ::open(temp_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        throw std::runtime_error("Unable to open " + temp_path.string() + ": " + std::strerror(errno));
    }
    try {
        write_all(fd, contents, temp_path);
    } catch (const std::runtime_error&) {
        ::close(fd);
        std::filesystem::remove(temp_path);
        throw;
    }
    if (::close(fd) != 0) {
        std::filesystem::remove(temp_path);
        throw std::runtime_error("Close failed for " + temp_path.string());
    }
    std::filesystem::rename(temp_path, final_path);
    return final_path;
}

std::uint64_t StorageManager::file_size(const std::filesystem::path& absolute_path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(absolute_path, ec);
    return ec ? 0 : size;
}

}  // namespace canvas::server
