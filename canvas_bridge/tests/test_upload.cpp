#include "errors.hpp"
#include "mapping_store.hpp"
#include "report_writer.hpp"
#include "storage_manager.hpp"
#include "test_support.hpp"
#include "upload_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using canvas::test::assert_true;
using canvas::test::make_temp_dir;
namespace server = canvas::server;

namespace {

const server::CourseInfo kCourse{"101", "Algorithms", "CS101"};

server::UploadPolicy default_policy() {
    return server::UploadPolicy{{".pdf", ".txt", ".md"}, 1024};
}

server::FileRecord stored_file(server::StorageManager& storage,
                               const std::string& file_id,
                               const std::string& relative_path,
                               const std::string& signature,
                               const std::string& contents = "lecture notes") {
    storage.write_file(kCourse.id, relative_path, contents);
    return server::FileRecord{file_id, kCourse.id, relative_path, signature, true};
}

void test_dedup_across_restarts() {
    const auto dir = make_temp_dir("canvas-upload-dedup-");
    auto logger = canvas::test::quiet_logger(dir);
    server::StorageManager storage(dir + "/files");
    canvas::test::FakeVectorStore provider;
    const auto record = stored_file(storage, "7", "Files/week1.pdf", "t1:13");

    {
        server::MappingStore mapping(dir + "/state.db");
        mapping.initialize_schema();
        server::UploadOrchestrator uploader(provider, mapping, storage, default_policy(), logger);
        const auto first = uploader.maybe_upload(kCourse, record);
        assert_true(first.status == server::UploadStatus::kUploaded, "first offer uploads");
        assert_true(first.store_file_id == "file_1", "provider file id returned");
        const auto second = uploader.maybe_upload(kCourse, record);
        assert_true(second.status == server::UploadStatus::kSkippedDuplicate, "same identity is not re-uploaded");
    }

    server::MappingStore reopened(dir + "/state.db");
    reopened.initialize_schema();
    server::UploadOrchestrator restarted(provider, reopened, storage, default_policy(), logger);
    const auto after_restart = restarted.maybe_upload(kCourse, record);
    assert_true(after_restart.status == server::UploadStatus::kSkippedDuplicate, "dedup survives a restart");
    assert_true(provider.upload_count() == 1, "provider saw exactly one upload");
    assert_true(provider.store_names.size() == 1, "store created once");
    std::filesystem::remove_all(dir);
}

void test_changed_signature_uploads_again() {
    const auto dir = make_temp_dir("canvas-upload-changed-");
    auto logger = canvas::test::quiet_logger(dir);
    server::StorageManager storage(dir + "/files");
    server::MappingStore mapping(dir + "/state.db");
    mapping.initialize_schema();
    canvas::test::FakeVectorStore provider;
    server::UploadOrchestrator uploader(provider, mapping, storage, default_policy(), logger);

    auto record = stored_file(storage, "7", "Files/week1.pdf", "t1:13");
    assert_true(uploader.maybe_upload(kCourse, record).status == server::UploadStatus::kUploaded, "v1 uploaded");
    record.signature = "t2:13";
    assert_true(uploader.maybe_upload(kCourse, record).status == server::UploadStatus::kUploaded,
                "new signature is a new identity");
    assert_true(provider.store_names.size() == 1, "existing store reused");
    assert_true(provider.uploads[0].first == provider.uploads[1].first, "both uploads target the same store");
    std::filesystem::remove_all(dir);
}

void test_ineligible_files_are_skipped() {
    const auto dir = make_temp_dir("canvas-upload-skip-");
    auto logger = canvas::test::quiet_logger(dir);
    server::StorageManager storage(dir + "/files");
    server::MappingStore mapping(dir + "/state.db");
    mapping.initialize_schema();
    canvas::test::FakeVectorStore provider;
    server::UploadOrchestrator uploader(provider, mapping, storage, default_policy(), logger);

    const auto video = stored_file(storage, "1", "Files/lecture.mp4", "t1:5");
    assert_true(uploader.maybe_upload(kCourse, video).status == server::UploadStatus::kSkippedUnsupported,
                "unsupported extension skipped");
    const auto big = stored_file(storage, "2", "Files/huge.pdf", "t2:2000", std::string(2000, 'x'));
    assert_true(uploader.maybe_upload(kCourse, big).status == server::UploadStatus::kSkippedUnsupported,
                "oversize file skipped");
    assert_true(provider.store_names.empty(), "no store created for skipped files");
    assert_true(!mapping.find_store(kCourse.id), "nothing recorded");

    assert_true(uploader.eligible("Files/NOTES.PDF", 10), "extension match is case-insensitive");
    assert_true(!uploader.eligible("Files/README", 10), "files without extension are ineligible");
    std::filesystem::remove_all(dir);
}

void test_store_recorded_before_first_upload() {
    const auto dir = make_temp_dir("canvas-upload-order-");
    auto logger = canvas::test::quiet_logger(dir);
    server::StorageManager storage(dir + "/files");
    server::MappingStore mapping(dir + "/state.db");
    mapping.initialize_schema();
    canvas::test::FakeVectorStore provider;
    provider.mapping = &mapping;
    provider.mapping_course = kCourse.id;
    server::UploadOrchestrator uploader(provider, mapping, storage, default_policy(), logger);

    const auto record = stored_file(storage, "3", "Files/intro.md", "t1:13");
    assert_true(uploader.maybe_upload(kCourse, record).status == server::UploadStatus::kUploaded, "uploaded");
    assert_true(provider.store_recorded_before_upload, "store mapping persisted before the provider upload");
    assert_true(provider.store_names[0] == "CS101_Algorithms", "store named after the course");
    std::filesystem::remove_all(dir);
}

void test_failed_upload_is_retried() {
    const auto dir = make_temp_dir("canvas-upload-retry-");
    auto logger = canvas::test::quiet_logger(dir);
    server::StorageManager storage(dir + "/files");
    server::MappingStore mapping(dir + "/state.db");
    mapping.initialize_schema();
    canvas::test::FakeVectorStore provider;
    provider.failing_names = {"broken.txt"};
    server::UploadOrchestrator uploader(provider, mapping, storage, default_policy(), logger);

    const auto record = stored_file(storage, "4", "Files/broken.txt", "t1:13");
    const auto failed = uploader.maybe_upload(kCourse, record);
    assert_true(failed.status == server::UploadStatus::kFailed, "provider error reported as failure");
    assert_true(failed.error.find("broken.txt") != std::string::npos, "error names the file");
    assert_true(!mapping.is_uploaded(kCourse.id, server::UploadOrchestrator::file_identity(record)),
                "failure is not recorded as uploaded");

    provider.failing_names.clear();
    assert_true(uploader.maybe_upload(kCourse, record).status == server::UploadStatus::kUploaded,
                "next offer retries the upload");
    std::filesystem::remove_all(dir);
}

void test_store_name_is_bounded() {
    const server::CourseInfo long_course{"9", std::string(150, 'n'), "CODE"};
    assert_true(server::UploadOrchestrator::store_name(long_course).size() == 100, "store name truncated");
    const server::CourseInfo bare{"9", "", ""};
    assert_true(server::UploadOrchestrator::store_name(bare) == "course_9", "fallback store name");
    const server::FileRecord record{"42", "9", "Files/a.pdf", "t:1", true};
    assert_true(server::UploadOrchestrator::file_identity(record) == "42@t:1", "identity joins id and signature");
}

void test_report_merges_courses() {
    const auto dir = make_temp_dir("canvas-report-");
    server::ReportWriter writer(dir + "/out/report.json", dir + "/out/mapping.json");

    server::CourseStats first;
    first.downloaded = 3;
    first.bytes = 300;
    writer.write_report({{"101", first}});

    server::CourseStats second;
    second.failed = 1;
    second.record_error("Files/b.pdf: timeout");
    writer.write_report({{"102", second}});

    std::ifstream in(writer.report_path());
    const auto report = nlohmann::json::parse(in);
    assert_true(report["courses"]["101"]["downloaded"] == 3, "earlier course kept");
    assert_true(report["courses"]["102"]["failed"] == 1, "new course added");
    assert_true(report["courses"]["102"]["errors"].size() == 1, "errors projected");

    server::CourseStats noisy;
    for (int i = 0; i < 50; ++i) {
        noisy.record_error("error " + std::to_string(i));
    }
    assert_true(noisy.errors.size() == server::kMaxReportedErrors, "error list capped");
    std::filesystem::remove_all(dir);
}

void test_mapping_projection_round_trips() {
    const auto dir = make_temp_dir("canvas-mapping-");
    server::MappingStore mapping(dir + "/state.db");
    mapping.initialize_schema();
    mapping.record_store("101", "vs_1");
    mapping.record_upload("101", server::UploadedFile{"7@t1", "Files/a.pdf", "file_1"});
    mapping.record_store("202", "vs_2");

    server::ReportWriter writer(dir + "/report.json", dir + "/mapping.json");
    writer.write_mapping(mapping.snapshot());

    const auto loaded = writer.read_mapping();
    assert_true(loaded.size() == 2, "both courses projected");
    assert_true(loaded.at("101").vector_store_id == "vs_1", "store id projected");
    assert_true(loaded.at("101").files.size() == 1 && loaded.at("101").files[0].store_file_id == "file_1",
                "uploaded files projected");
    assert_true(loaded.at("202").files.empty(), "store without uploads projected");

    server::ReportWriter missing(dir + "/none.json", dir + "/none-mapping.json");
    assert_true(missing.read_mapping().empty(), "absent mapping file reads as empty");
    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    try {
        test_dedup_across_restarts();
        test_changed_signature_uploads_again();
        test_ineligible_files_are_skipped();
        test_store_recorded_before_first_upload();
        test_failed_upload_is_retried();
        test_store_name_is_bounded();
        test_report_merges_courses();
        test_mapping_projection_round_trips();
        std::cout << "upload_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "upload_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
