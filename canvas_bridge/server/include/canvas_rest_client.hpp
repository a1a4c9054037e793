#pragma once

#include "collaborators.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace canvas::server {

// Files linked from one course module, as Canvas file objects.
struct ModuleListing {
    std::string name;
    nlohmann::json files = nlohmann::json::array();
};

// Canvas LMS REST API v1 over bearer-token auth. A course listing covers the
// files linked from its modules and its Files area. When the Files area is
// refused the course folders are walked instead.
class CanvasRestClient : public CanvasClient {
public:
    CanvasRestClient(std::string base_url, std::string access_token, const HttpClient& http);

    std::vector<CourseInfo> list_courses() override;
    std::vector<RemoteFile> list_files(const CourseInfo& course) override;
    std::string download(const RemoteFile& file) override;

    // Builds listing entries from raw Canvas file objects. Module files land
    // under Modules/<module>/ and the Files area under Files/. A name already
    // taken in its folder gets "_<file id>" (then a counter) inserted before
    // the extension. A file id is listed at most once per folder.
    static std::vector<RemoteFile> listing_from_json(const std::string& course_id,
                                                     const std::vector<ModuleListing>& modules,
                                                     const nlohmann::json& files);
    static std::vector<RemoteFile> files_from_json(const std::string& course_id, const nlohmann::json& files);

private:
    std::vector<ModuleListing> list_modules(const CourseInfo& course) const;
    nlohmann::json list_files_area(const CourseInfo& course) const;
    std::optional<nlohmann::json> file_info(const std::string& file_id) const;
    std::vector<nlohmann::json> get_paginated(const std::string& url) const;
    std::vector<std::string> auth_headers() const;

    std::string base_url_;
    std::string access_token_;
    const HttpClient& http_;
};

}  // namespace canvas::server
