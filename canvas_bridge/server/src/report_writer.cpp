#include "report_writer.hpp"

#include "errors.hpp"

#include <fstream>
#include <utility>

namespace canvas::server {

namespace {

nlohmann::json read_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

void write_json_atomically(const std::filesystem::path& path, const nlohmann::json& document) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out) {
                throw StorageError("Unable to open " + temp.string());
            }
            out << document.dump(2) << '\n';
            out.flush();
            if (!out) {
                throw StorageError("Unable to write " + temp.string());
            }
        }
        std::filesystem::rename(temp, path);
    } catch (const std::filesystem::filesystem_error& ex) {
        throw StorageError("Unable to replace " + path.string() + ": " + ex.what());
    }
}

}  // namespace

ReportWriter::ReportWriter(std::filesystem::path report_path, std::filesystem::path mapping_path)
    : report_path_(std::move(report_path)), mapping_path_(std::move(mapping_path)) {}

nlohmann::json ReportWriter::stats_to_json(const CourseStats& stats) {
    return nlohmann::json{{"downloaded", stats.downloaded},
                          {"skipped", stats.skipped},
                          {"failed", stats.failed},
                          {"uploaded", stats.uploaded},
                          {"upload_skipped", stats.upload_skipped},
                          {"upload_failed", stats.upload_failed},
                          {"bytes", stats.bytes},
                          {"errors", stats.errors}};
}

nlohmann::json ReportWriter::mapping_to_json(const VectorStoreMapping& mapping) {
    auto courses = nlohmann::json::object();
    for (const auto& [course_id, entry] : mapping) {
        auto files = nlohmann::json::array();
        for (const auto& file : entry.files) {
            files.push_back({{"file_identity", file.file_identity},
                             {"relative_path", file.relative_path},
                             {"store_file_id", file.store_file_id}});
        }
        courses[course_id] = {{"vector_store_id", entry.vector_store_id}, {"files", std::move(files)}};
    }
    return nlohmann::json{{"courses", std::move(courses)}};
}

void ReportWriter::write_report(const std::map<std::string, CourseStats>& per_course) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto document = read_json(report_path_);
    if (!document.contains("courses") || !document["courses"].is_object()) {
        document["courses"] = nlohmann::json::object();
    }
    for (const auto& [course_id, stats] : per_course) {
        document["courses"][course_id] = stats_to_json(stats);
    }
    write_json_atomically(report_path_, document);
}

void ReportWriter::write_mapping(const VectorStoreMapping& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_json_atomically(mapping_path_, mapping_to_json(mapping));
}

VectorStoreMapping ReportWriter::read_mapping() const {
    VectorStoreMapping mapping;
    const auto document = read_json(mapping_path_);
    const auto courses = document.find("courses");
    if (courses == document.end() || !courses->is_object()) {
        return mapping;
    }
    for (auto it = courses->begin(); it != courses->end(); ++it) {
        const auto& entry = it.value();
        if (!entry.is_object() || !entry.contains("vector_store_id") || !entry["vector_store_id"].is_string()) {
            continue;
        }
        CourseMapping course;
        course.vector_store_id = entry["vector_store_id"].get<std::string>();
        if (entry.contains("files") && entry["files"].is_array()) {
            for (const auto& file : entry["files"]) {
                if (!file.is_object()) {
                    continue;
                }
                course.files.push_back(UploadedFile{file.value("file_identity", std::string{}),
                                                    file.value("relative_path", std::string{}),
                                                    file.value("store_file_id", std::string{})});
            }
        }
        mapping.emplace(it.key(), std::move(course));
    }
    return mapping;
}

}  // namespace canvas::server
