#include "course_lock.hpp"
#include "credential_verifier.hpp"
#include "download_job.hpp"
#include "encoding.hpp"
#include "manifest_store.hpp"
#include "mapping_store.hpp"
#include "report_writer.hpp"
#include "session.hpp"
#include "session_router.hpp"
#include "storage_manager.hpp"
#include "sync_engine.hpp"
#include "task_executor.hpp"
#include "test_support.hpp"
#include "totp.hpp"
#include "upload_orchestrator.hpp"
#include "workflow_machine.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>

using canvas::protocol::Json;
using canvas::test::assert_true;
using canvas::test::make_temp_dir;
using canvas::test::remote_file;
namespace server = canvas::server;

namespace {

const std::string kPassword = "open sesame";
const std::string kTotpKey = "12345678901234567890";
constexpr std::time_t kNow = 1700000000;

std::string valid_code() {
    return canvas::totp::code_at(kTotpKey, kNow);
}

// Collects everything the bridge sends back. Progress arrives from transfer
// workers, hence the lock.
class Outbox {
public:
    server::Emit emitter() {
        return [this](const Json& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        };
    }

    std::vector<Json> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto out = std::move(messages_);
        messages_.clear();
        return out;
    }

private:
    std::mutex mutex_;
    std::vector<Json> messages_;
};

struct Bridge {
    explicit Bridge(bool interactive = false)
        : dir(make_temp_dir("canvas-workflow-")),
          logger(dir + "/test.log", LogLevel::kDebug, false),
          manifest(dir + "/state.db"),
          mapping(dir + "/state.db"),
          storage(dir + "/files"),
          reports(dir + "/report.json", dir + "/mapping.json"),
          transfer_pool("transfer", 2),
          sync(canvas, manifest, storage, logger),
          uploader(vector_store, mapping, storage, server::UploadPolicy{{".pdf", ".txt"}, 0}, logger),
          jobs(sync, &uploader, mapping, locks, transfer_pool, reports, logger),
          workflow(&canvas, &agent, jobs, interactive, logger),
          verifier(server::CredentialConfig{kPassword, canvas::util::base32_encode(kTotpKey), true, {}, 1}),
          router(verifier, workflow, logger, [] { return std::chrono::system_clock::from_time_t(kNow); }),
          session(1, "127.0.0.1:50000") {
        manifest.initialize_schema();
        mapping.initialize_schema();
        canvas.courses = {{"101", "Algorithms", "CS101"}, {"102", "Databases", "CS102"}};
        canvas.files["101"] = {remote_file("101", "1", "Files/syllabus.pdf", "t1:10"),
                               remote_file("101", "2", "Files/week1.pdf", "t2:20"),
                               remote_file("101", "3", "Files/slides.pptx", "t3:30")};
        canvas.files["102"] = {remote_file("102", "9", "Files/schema.txt", "t9:90")};
    }

    ~Bridge() {
        transfer_pool.shutdown();
        std::filesystem::remove_all(dir);
    }

    std::vector<Json> send(const Json& message) {
        router.handle_text(session, message.dump(), outbox.emitter());
        return outbox.take();
    }

    std::vector<Json> send_raw(const std::string& text) {
        router.handle_text(session, text, outbox.emitter());
        return outbox.take();
    }

    void login() {
        const auto replies = send({{"type", "auth"}, {"password", kPassword}, {"totp", valid_code()}});
        assert_true(replies.size() == 1 && replies[0]["status"] == "authenticated", "login succeeds");
    }

    std::string dir;
    server::Logger logger;
    server::ManifestStore manifest;
    server::MappingStore mapping;
    server::StorageManager storage;
    server::ReportWriter reports;
    canvas::test::FakeCanvasClient canvas;
    canvas::test::FakeVectorStore vector_store;
    canvas::test::FakeChatAgent agent;
    server::TaskExecutor transfer_pool;
    server::CourseLockTable locks;
    server::SyncEngine sync;
    server::UploadOrchestrator uploader;
    server::DownloadJobRunner jobs;
    server::WorkflowMachine workflow;
    server::CredentialVerifier verifier;
    server::SessionRouter router;
    server::Session session;
    Outbox outbox;
};

bool is_error(const Json& message, const std::string& kind) {
    return message.value("type", "") == "error" && message.value("kind", "") == kind;
}

template <typename State>
bool in_state(const server::Session& session) {
    return std::holds_alternative<State>(session.workflow());
}

void test_messages_before_auth_are_rejected() {
    Bridge bridge;
    for (const auto& message : {Json{{"type", "chat"}, {"query", "hi"}}, Json{{"type", "download"}},
                                Json{{"type", "cancel"}}}) {
        const auto replies = bridge.send(message);
        assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "unauthenticated request rejected");
        assert_true(replies[0]["message"] == "Authentication required.", "auth required message");
    }
    assert_true(!bridge.session.authenticated(), "session still unauthenticated");
    assert_true(bridge.canvas.downloads() == 0, "no side effects before auth");
}

void test_auth_failure_then_success() {
    Bridge bridge;
    auto replies = bridge.send({{"type", "auth"}, {"password", kPassword}, {"totp", "000000"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "wrong code rejected");
    assert_true(replies[0]["message"] == "Authentication failed.", "failure message does not name the factor");

    replies = bridge.send({{"type", "auth"}, {"password", "wrong"}, {"totp", valid_code()}});
    assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "wrong password rejected");
    replies = bridge.send({{"type", "auth"}, {"password", 42}});
    assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "malformed auth rejected");
    assert_true(bridge.session.stats().auth_failures == 3, "failures counted");

    bridge.login();
    assert_true(bridge.session.authenticated(), "session authenticated");
    replies = bridge.send({{"type", "auth"}, {"password", kPassword}, {"totp", valid_code()}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "second auth is a protocol error");
}

void test_invalid_json_is_protocol_error() {
    Bridge bridge;
    auto replies = bridge.send_raw("{not json");
    assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "malformed JSON before auth needs auth");
    replies = bridge.send_raw("[1,2,3]");
    assert_true(replies.size() == 1 && is_error(replies[0], "AuthError"), "non-object before auth needs auth");
    assert_true(bridge.session.stats().auth_failures == 0, "unparsable text is not an auth attempt");

    bridge.login();
    replies = bridge.send_raw("{not json");
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "malformed JSON rejected");
    replies = bridge.send_raw("[1,2,3]");
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "non-object rejected");
    replies = bridge.send({{"type", "upload"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "unknown type rejected");
}

void test_chat_round_trip() {
    Bridge bridge;
    bridge.login();
    auto replies = bridge.send({{"type", "chat"}, {"query", "when is the midterm?"}});
    assert_true(replies.size() == 1 && replies[0]["type"] == "chat_result", "chat answered");
    assert_true(replies[0]["text"] == "answer to when is the midterm?", "answer text forwarded");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "chat returns to idle");

    replies = bridge.send({{"query", "untyped messages are chat"}});
    assert_true(replies.size() == 1 && replies[0]["type"] == "chat_result", "missing type treated as chat");

    replies = bridge.send({{"type", "chat"}, {"query", ""}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "empty query rejected");

    bridge.agent.fail = true;
    replies = bridge.send({{"type", "chat"}, {"query", "still there?"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "FatalError"), "agent failure is fatal");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "failed chat returns to idle");
    assert_true(bridge.session.stats().chats_answered == 2, "only answered chats counted");
}

void test_download_with_auto_confirm() {
    Bridge bridge;
    bridge.login();
    auto replies = bridge.send({{"type", "download"}});
    assert_true(replies.size() == 1 && replies[0]["type"] == "roster", "roster issued");
    const auto& entries = replies[0]["entries"];
    assert_true(entries.size() == 2, "roster lists both courses");
    assert_true(entries[0]["index"] == 1 && entries[0]["course_id"] == "101", "first entry");
    assert_true(entries[1]["index"] == 2 && entries[1]["name"] == "Databases", "second entry");
    assert_true(in_state<server::workflow::DownloadAwaitingSelection>(bridge.session), "awaiting selection");

    replies = bridge.send({{"type", "download"}, {"course_indices", Json::array({1})}, {"auto_confirm", true}});
    assert_true(replies.size() >= 2, "progress and summary emitted");
    assert_true(replies.front()["type"] == "progress", "progress comes first");
    const auto& summary = replies.back();
    assert_true(summary["type"] == "summary" && summary["status"] == "completed", "job completed");
    const auto& stats = summary["per_course_stats"]["101"];
    const auto processed = stats["downloaded"].get<std::size_t>() + stats["skipped"].get<std::size_t>() +
                           stats["failed"].get<std::size_t>();
    assert_true(processed == bridge.canvas.files["101"].size(), "every listed file accounted for");
    assert_true(stats["uploaded"] == 2 && stats["upload_skipped"] == 1, "eligible files uploaded");
    assert_true(!summary["per_course_stats"].contains("102"), "unselected course untouched");
    assert_true(summary["report_path"] == (bridge.dir + "/report.json"), "report path reported");
    assert_true(std::filesystem::exists(bridge.dir + "/report.json"), "report written");
    assert_true(std::filesystem::exists(bridge.dir + "/mapping.json"), "mapping written");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "job returns to idle");
    assert_true(bridge.session.stats().jobs_completed == 1, "job counted");

    bridge.send({{"type", "download"}});
    replies = bridge.send({{"type", "download"}, {"course_ids", Json::array({"101"})}, {"auto_confirm", true}});
    const auto& rerun = replies.back()["per_course_stats"]["101"];
    assert_true(rerun["skipped"] == 3 && rerun["downloaded"] == 0, "rerun skips unchanged files");
    assert_true(rerun["uploaded"] == 0, "rerun uploads nothing new");
}

void test_unknown_selection_keeps_roster() {
    Bridge bridge;
    bridge.login();
    bridge.send({{"type", "download"}});
    auto replies = bridge.send({{"type", "download"}, {"course_indices", Json::array({7})}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "unknown index rejected");
    assert_true(in_state<server::workflow::DownloadAwaitingSelection>(bridge.session), "still awaiting selection");

    replies = bridge.send({{"type", "download"}, {"course_ids", Json::array({"999"})}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "unknown id rejected");
    replies = bridge.send(
        {{"type", "download"}, {"course_indices", Json::array({1})}, {"course_ids", Json::array({"101"})}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "both selectors rejected");
    replies = bridge.send({{"type", "download"}, {"course_indices", Json::array()}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "empty selection rejected");
    assert_true(in_state<server::workflow::DownloadAwaitingSelection>(bridge.session), "roster kept");
    assert_true(bridge.canvas.downloads() == 0, "nothing fetched");
}

void test_selection_without_roster() {
    Bridge bridge;
    bridge.login();
    auto replies = bridge.send({{"type", "download"}, {"course_indices", Json::array({1})}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "selection needs a roster");
    replies = bridge.send({{"type", "download"}, {"confirm", true}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "confirm needs a pending job");
    replies = bridge.send({{"type", "cancel"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "nothing to cancel");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "still idle");
}

void test_interactive_confirmation() {
    Bridge bridge(true);
    bridge.login();
    bridge.send({{"type", "download"}});
    auto replies = bridge.send({{"type", "download"}, {"course_indices", Json::array({"2", 2})}});
    assert_true(replies.size() == 1 && replies[0]["type"] == "confirmation", "confirmation requested");
    assert_true(replies[0]["courses"].size() == 1, "duplicate selections collapsed");
    assert_true(replies[0]["courses"][0]["course_id"] == "102", "selected course listed");
    assert_true(in_state<server::workflow::DownloadAwaitingConfirmation>(bridge.session), "awaiting confirmation");

    replies = bridge.send({{"type", "download"}, {"confirm", "yes"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "ProtocolError"), "non-boolean confirm rejected");

    replies = bridge.send({{"type", "download"}, {"confirm", false}});
    assert_true(replies.size() == 1 && replies[0]["status"] == "cancelled", "rejection cancels");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "rejection returns to idle");
    assert_true(bridge.canvas.downloads() == 0, "rejected job fetched nothing");

    bridge.send({{"type", "download"}});
    bridge.send({{"type", "download"}, {"course_ids", Json::array({102})}});
    replies = bridge.send({{"type", "download"}, {"confirm", true}});
    assert_true(replies.back()["type"] == "summary" && replies.back()["status"] == "completed", "confirmed job ran");
    assert_true(replies.back()["per_course_stats"]["102"]["downloaded"] == 1, "confirmed course fetched");
}

void test_cancel_during_selection() {
    Bridge bridge;
    bridge.login();
    bridge.send({{"type", "download"}});
    auto replies = bridge.send({{"type", "cancel"}});
    assert_true(replies.size() == 1 && replies[0]["status"] == "cancelled", "cancel acknowledged");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "cancel returns to idle");
}

void test_roster_failure_is_fatal() {
    Bridge bridge;
    bridge.login();
    bridge.canvas.fail_roster = true;
    auto replies = bridge.send({{"type", "download"}});
    assert_true(replies.size() == 1 && is_error(replies[0], "FatalError"), "roster failure reported");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "roster failure returns to idle");

    bridge.canvas.fail_roster = false;
    bridge.canvas.courses.clear();
    replies = bridge.send({{"type", "download"}});
    assert_true(replies.size() == 1 && replies[0]["entries"].empty(), "empty roster emitted");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "empty roster stays idle");
}

void test_listing_failure_is_reported_per_course() {
    Bridge bridge;
    bridge.login();
    bridge.canvas.failing_listings = {"102"};
    bridge.send({{"type", "download"}});
    const auto replies =
        bridge.send({{"type", "download"}, {"course_indices", Json::array({1, 2})}, {"auto_confirm", true}});
    const auto& summary = replies.back();
    assert_true(summary["status"] == "completed", "other courses still complete");
    assert_true(summary["per_course_stats"]["101"]["downloaded"] == 3, "healthy course downloaded");
    assert_true(summary["per_course_stats"]["102"]["errors"].size() == 1, "listing failure recorded");
}

void test_cancelled_session_emits_no_summary() {
    Bridge bridge;
    bridge.login();
    bridge.send({{"type", "download"}});
    bridge.session.cancel();
    const auto replies =
        bridge.send({{"type", "download"}, {"course_indices", Json::array({1})}, {"auto_confirm", true}});
    for (const auto& message : replies) {
        assert_true(message["type"] != "summary", "no summary after disconnect");
    }
    assert_true(bridge.canvas.downloads() == 0, "cancelled job fetched nothing");
    assert_true(!std::filesystem::exists(bridge.dir + "/report.json"), "cancelled job writes no report");
}

void test_unschedulable_job_returns_to_idle() {
    Bridge bridge;
    bridge.login();
    bridge.send({{"type", "download"}});
    bridge.transfer_pool.shutdown();
    auto replies =
        bridge.send({{"type", "download"}, {"course_indices", Json::array({1, 2})}, {"auto_confirm", true}});
    assert_true(replies.size() == 1 && is_error(replies[0], "FatalError"), "scheduling failure reported");
    assert_true(in_state<server::workflow::Idle>(bridge.session), "failed job returns to idle");
    assert_true(bridge.canvas.downloads() == 0, "nothing fetched");
    assert_true(!std::filesystem::exists(bridge.dir + "/report.json"), "no report for an unscheduled job");

    replies = bridge.send({{"type", "chat"}, {"query", "still usable?"}});
    assert_true(replies.size() == 1 && replies[0]["type"] == "chat_result", "session keeps serving");
}

}  // namespace

int main() {
    try {
        test_messages_before_auth_are_rejected();
        test_auth_failure_then_success();
        test_invalid_json_is_protocol_error();
        test_chat_round_trip();
        test_download_with_auto_confirm();
        test_unknown_selection_keeps_roster();
        test_selection_without_roster();
        test_interactive_confirmation();
        test_cancel_during_selection();
        test_roster_failure_is_fatal();
        test_listing_failure_is_reported_per_course();
        test_cancelled_session_emits_no_summary();
        test_unschedulable_job_returns_to_idle();
        std::cout << "workflow_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "workflow_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
