#include "canvas_rest_client.hpp"

#include "storage_manager.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>
#include <utility>

namespace canvas::server {

namespace {

constexpr const char* kFilesFolder = "Files";
constexpr const char* kModulesFolder = "Modules";
constexpr int kMaxPages = 200;

// A non-2xx page. Refusals of optional listings are recoverable.
class CanvasStatusError : public std::runtime_error {
public:
    CanvasStatusError(long status, const std::string& url)
        : std::runtime_error("Canvas returned HTTP " + std::to_string(status) + " for " + url), status_(status) {}

    bool refused() const { return status_ == 401 || status_ == 403 || status_ == 404; }

private:
    long status_;
};

std::string id_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return {};
}

std::string string_or(const nlohmann::json& object, const char* key, const std::string& fallback = {}) {
    const auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

std::string with_suffix(const std::string& name, const std::string& suffix) {
    const std::filesystem::path path(name);
    const auto ext = path.extension().string();
    const auto stem = name.substr(0, name.size() - ext.size());
    return stem + "_" + suffix + ext;
}

// Hands out course-relative paths, never the same one twice.
class PathAllocator {
public:
    std::string claim(const std::string& folder, const std::string& name, const std::string& file_id) {
        auto candidate = folder + "/" + name;
        for (int attempt = 1; !taken_.insert(candidate).second; ++attempt) {
            const auto suffix = attempt == 1 ? file_id : file_id + "_" + std::to_string(attempt);
            candidate = folder + "/" + with_suffix(name, suffix);
        }
        return candidate;
    }

private:
    std::set<std::string> taken_;
};

std::optional<RemoteFile> entry_from_json(const std::string& course_id, const nlohmann::json& item) {
    if (!item.is_object() || !item.contains("id")) {
        return std::nullopt;
    }
    RemoteFile file;
    file.file_id = id_string(item["id"]);
    if (file.file_id.empty()) {
        return std::nullopt;
    }
    file.course_id = course_id;
    file.download_url = string_or(item, "url");
    if (item.contains("size") && item["size"].is_number_unsigned()) {
        file.size = item["size"].get<std::uint64_t>();
    }
    const auto stamp = string_or(item, "modified_at", string_or(item, "updated_at"));
    file.signature = stamp + ":" + std::to_string(file.size);
    return file;
}

}  // namespace

CanvasRestClient::CanvasRestClient(std::string base_url, std::string access_token, const HttpClient& http)
    : base_url_(std::move(base_url)), access_token_(std::move(access_token)), http_(http) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::vector<std::string> CanvasRestClient::auth_headers() const {
    return {"Authorization: Bearer " + access_token_, "Accept: application/json"};
}

std::vector<nlohmann::json> CanvasRestClient::get_paginated(const std::string& url) const {
    std::vector<nlohmann::json> items;
    std::string next = url;
    for (int page = 0; !next.empty() && page < kMaxPages; ++page) {
        const auto response = http_.get(next, auth_headers());
        if (!response.ok()) {
            throw CanvasStatusError(response.status, next);
        }
        const auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_array()) {
            throw std::runtime_error("Canvas returned a non-array page for " + next);
        }
        for (const auto& item : body) {
            items.push_back(item);
        }
        const auto link = response.headers.find("link");
        next = link == response.headers.end() ? std::string{} : HttpClient::next_link(link->second);
    }
    return items;
}

std::vector<CourseInfo> CanvasRestClient::list_courses() {
    std::vector<CourseInfo> courses;
    for (const auto& item : get_paginated(base_url_ + "/api/v1/courses?enrollment_state=active&per_page=100")) {
        if (!item.is_object()) {
            continue;
        }
        // Courses the user can no longer open come back without a name.
        const auto name = string_or(item, "name");
        const auto id = item.contains("id") ? id_string(item["id"]) : std::string{};
        if (id.empty() || name.empty()) {
            continue;
        }
        courses.push_back(CourseInfo{id, name, string_or(item, "course_code")});
    }
    return courses;
}

std::vector<RemoteFile> CanvasRestClient::listing_from_json(const std::string& course_id,
                                                            const std::vector<ModuleListing>& modules,
                                                            const nlohmann::json& files) {
    std::vector<RemoteFile> listing;
    std::set<std::pair<std::string, std::string>> placed;
    PathAllocator paths;

    auto add = [&](const nlohmann::json& item, const std::string& folder) {
        auto file = entry_from_json(course_id, item);
        if (!file || !placed.emplace(folder, file->file_id).second) {
            return;
        }
        const auto name =
            StorageManager::sanitize_filename(string_or(item, "display_name", string_or(item, "filename")));
        file->relative_path = paths.claim(folder, name, file->file_id);
        listing.push_back(std::move(*file));
    };

    for (const auto& module : modules) {
        const auto folder = std::string(kModulesFolder) + "/" + StorageManager::sanitize_filename(module.name);
        for (const auto& item : module.files) {
            add(item, folder);
        }
    }
    for (const auto& item : files) {
        add(item, kFilesFolder);
    }
    return listing;
}

std::vector<RemoteFile> CanvasRestClient::files_from_json(const std::string& course_id, const nlohmann::json& files) {
    return listing_from_json(course_id, {}, files);
}

std::optional<nlohmann::json> CanvasRestClient::file_info(const std::string& file_id) const {
    const auto response = http_.get(base_url_ + "/api/v1/files/" + file_id, auth_headers());
    // Locked or unpublished module files are refused individually.
    if (!response.ok()) {
        return std::nullopt;
    }
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return std::nullopt;
    }
    return body;
}

std::vector<ModuleListing> CanvasRestClient::list_modules(const CourseInfo& course) const {
    const auto course_url = base_url_ + "/api/v1/courses/" + course.id;
    std::vector<nlohmann::json> modules;
    try {
        modules = get_paginated(course_url + "/modules?include%5B%5D=items&per_page=100");
    } catch (const CanvasStatusError& ex) {
        if (!ex.refused()) {
            throw;
        }
        return {};
    }

    std::vector<ModuleListing> listings;
    for (const auto& module : modules) {
        if (!module.is_object() || !module.contains("id")) {
            continue;
        }
        const auto module_id = id_string(module["id"]);
        ModuleListing listing;
        listing.name = string_or(module, "name", "Module_" + module_id);

        // Large modules come back without their items inlined.
        std::vector<nlohmann::json> items;
        if (module.contains("items") && module["items"].is_array() && !module["items"].empty()) {
            items.assign(module["items"].begin(), module["items"].end());
        } else {
            items = get_paginated(course_url + "/modules/" + module_id + "/items?per_page=100");
        }
        for (const auto& item : items) {
            if (!item.is_object() || string_or(item, "type") != "File" || !item.contains("content_id")) {
                continue;
            }
            const auto file_id = id_string(item["content_id"]);
            if (file_id.empty()) {
                continue;
            }
            if (auto info = file_info(file_id)) {
                listing.files.push_back(std::move(*info));
            }
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}

nlohmann::json CanvasRestClient::list_files_area(const CourseInfo& course) const {
    const auto course_url = base_url_ + "/api/v1/courses/" + course.id;
    try {
        return nlohmann::json(get_paginated(course_url + "/files?per_page=100"));
    } catch (const CanvasStatusError& ex) {
        if (!ex.refused()) {
            throw;
        }
    }

    auto files = nlohmann::json::array();
    for (const auto& folder : get_paginated(course_url + "/folders?per_page=100")) {
        if (!folder.is_object() || !folder.contains("id")) {
            continue;
        }
        const auto folder_id = id_string(folder["id"]);
        for (auto& item : get_paginated(base_url_ + "/api/v1/folders/" + folder_id + "/files?per_page=100")) {
            files.push_back(std::move(item));
        }
    }
    return files;
}

std::vector<RemoteFile> CanvasRestClient::list_files(const CourseInfo& course) {
    const auto modules = list_modules(course);
    nlohmann::json files;
    try {
        files = list_files_area(course);
    } catch (const CanvasStatusError& ex) {
        std::size_t module_files = 0;
        for (const auto& module : modules) {
            module_files += module.files.size();
        }
        if (!ex.refused() || module_files == 0) {
            throw;
        }
        files = nlohmann::json::array();
    }
    return listing_from_json(course.id, modules, files);
}

std::string CanvasRestClient::download(const RemoteFile& file) {
    if (file.download_url.empty()) {
        throw std::runtime_error("File " + file.file_id + " has no download URL");
    }
    auto response = http_.get(file.download_url, {"Authorization: Bearer " + access_token_});
    if (!response.ok()) {
        throw std::runtime_error("Download of file " + file.file_id + " returned HTTP " +
                                 std::to_string(response.status));
    }
    return std::move(response.body);
}

}  // namespace canvas::server
