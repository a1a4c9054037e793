#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace canvas::server {

struct CourseInfo {
    std::string id;
    std::string name;
    std::string code;
};

// One entry of a course's remote file listing.
struct RemoteFile {
    std::string file_id;
    std::string course_id;
    std::string relative_path;
    // modified_at (or updated_at) plus size; equal signatures mean equal content.
    std::string signature;
    std::string download_url;
    std::uint64_t size = 0;
};

// The natural-language agent. Implementations may block; failures throw.
class ChatAgent {
public:
    virtual ~ChatAgent() = default;
    virtual std::string answer(const std::string& query) = 0;
};

// Canvas LMS access. Every call may block on the network and throws
// std::runtime_error (or a subclass) on failure.
class CanvasClient {
public:
    virtual ~CanvasClient() = default;
    virtual std::vector<CourseInfo> list_courses() = 0;
    virtual std::vector<RemoteFile> list_files(const CourseInfo& course) = 0;
    virtual std::string download(const RemoteFile& file) = 0;
};

// Hosted vector store. upload() returns the id of the file attached to the
// store.
class VectorStoreProvider {
public:
    virtual ~VectorStoreProvider() = default;
    virtual std::string create_store(const std::string& name) = 0;
    virtual std::string upload(const std::string& vector_store_id, const std::filesystem::path& file) = 0;
};

}  // namespace canvas::server
