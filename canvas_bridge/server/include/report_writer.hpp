#pragma once

#include "course_stats.hpp"
#include "mapping_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace canvas::server {

// Projects job results to the run report and the mapping file. Both are
// rewritten through a temp file and rename; failures raise StorageError.
class ReportWriter {
public:
    ReportWriter(std::filesystem::path report_path, std::filesystem::path mapping_path);

    // Courses not in this run keep their previous entries.
    void write_report(const std::map<std::string, CourseStats>& per_course);
    void write_mapping(const VectorStoreMapping& mapping);

    // Previous mapping file contents; empty when absent or unreadable.
    VectorStoreMapping read_mapping() const;

    const std::filesystem::path& report_path() const { return report_path_; }
    const std::filesystem::path& mapping_path() const { return mapping_path_; }

    static nlohmann::json stats_to_json(const CourseStats& stats);
    static nlohmann::json mapping_to_json(const VectorStoreMapping& mapping);

private:
    std::filesystem::path report_path_;
    std::filesystem::path mapping_path_;
    std::mutex mutex_;
};

}  // namespace canvas::server
