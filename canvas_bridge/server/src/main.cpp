#include "bridge_server.hpp"
#include "canvas_rest_client.hpp"
#include "command_chat_agent.hpp"
#include "config_loader.hpp"
#include "course_lock.hpp"
#include "credential_verifier.hpp"
#include "download_job.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "manifest_store.hpp"
#include "mapping_store.hpp"
#include "openai_vector_store.hpp"
#include "password_hasher.hpp"
#include "report_writer.hpp"
#include "session_router.hpp"
#include "storage_manager.hpp"
#include "sync_engine.hpp"
#include "task_executor.hpp"
#include "upload_orchestrator.hpp"
#include "workflow_machine.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

namespace {
std::atomic<bool> g_should_run{true};
std::atomic<bool> g_reopen_log{false};

void handle_signal(int) {
    g_should_run = false;
}

void handle_hangup(int) {
    g_reopen_log = true;
}

struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

// Seeds the store from a mapping file written by an earlier deployment.
void import_mapping(const canvas::server::ReportWriter& reports,
                    canvas::server::MappingStore& mapping,
                    canvas::server::Logger& logger) {
    std::size_t imported = 0;
    for (const auto& [course_id, entry] : reports.read_mapping()) {
        mapping.record_store(course_id, entry.vector_store_id);
        for (const auto& file : entry.files) {
            if (!file.file_identity.empty()) {
                mapping.record_upload(course_id, file);
                ++imported;
            }
        }
    }
    if (imported > 0) {
        logger.info("Imported " + std::to_string(imported) + " uploaded files from " + reports.mapping_path().string());
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 2 && std::strcmp(argv[1], "--hash-password") == 0) {
        try {
            const auto salt = canvas::server::PasswordHasher::generate_salt();
            std::cout << canvas::server::PasswordHasher::hash_password(argv[2], salt) << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "Fatal error: " << ex.what() << std::endl;
            return 1;
        }
        return 0;
    }

    const std::string config_path = argc > 1 ? argv[1] : "canvas_bridge/server/config/bridge.conf";

    try {
        auto config = canvas::server::load_config(config_path);
        canvas::server::apply_environment(config);

        canvas::server::Logger logger(config.log_file, canvas::server::parse_log_level(config.log_level));
        CurlGlobal curl_global;

        canvas::server::CredentialVerifier verifier({.password = config.auth_password,
                                                     .totp_secret = config.totp_secret,
                                                     .totp_enabled = config.totp_enabled,
                                                     .totp = {.step_seconds = config.totp_step_seconds,
                                                              .digits = config.totp_digits},
                                                     .drift_steps = config.totp_drift_steps});
        if (!verifier.configured()) {
            logger.warn("No password or TOTP secret configured; every authentication attempt will fail");
        }

        canvas::server::ManifestStore manifest(config.database_file);
        manifest.initialize_schema();
        canvas::server::MappingStore mapping(config.database_file);
        mapping.initialize_schema();
        canvas::server::StorageManager storage(config.download_root);
        canvas::server::ReportWriter reports(config.report_file, config.mapping_file);
        import_mapping(reports, mapping, logger);

        canvas::server::HttpClient http;
        canvas::server::CanvasRestClient canvas_client(config.canvas_url, config.canvas_token, http);
        const bool canvas_configured = !config.canvas_url.empty() && !config.canvas_token.empty();
        if (!canvas_configured) {
            logger.warn("Canvas URL or access token missing; download requests will fail");
        }
        std::unique_ptr<canvas::server::OpenAiVectorStore> vector_store;
        std::unique_ptr<canvas::server::UploadOrchestrator> uploader;
        if (!config.openai_api_key.empty()) {
            vector_store =
                std::make_unique<canvas::server::OpenAiVectorStore>(config.openai_api_base, config.openai_api_key, http);
            uploader = std::make_unique<canvas::server::UploadOrchestrator>(
                *vector_store, mapping, storage,
                canvas::server::UploadPolicy{config.upload_extensions, config.max_upload_bytes}, logger);
        } else {
            logger.warn("OPENAI_API_KEY missing; vector store uploads are disabled");
        }
        std::unique_ptr<canvas::server::CommandChatAgent> agent;
        if (!config.agent_command.empty()) {
            agent = std::make_unique<canvas::server::CommandChatAgent>(config.agent_command);
        } else {
            logger.warn("No agent command configured; chat requests will fail");
        }

        canvas::server::TaskExecutor transfer_pool("transfer", config.transfer_threads);
        canvas::server::CourseLockTable course_locks;
        canvas::server::SyncEngine sync(canvas_client, manifest, storage, logger);
        canvas::server::DownloadJobRunner jobs(sync, uploader.get(), mapping, course_locks, transfer_pool, reports,
                                               logger);
        canvas::server::WorkflowMachine workflow(canvas_configured ? &canvas_client : nullptr, agent.get(), jobs,
                                                 config.interactive_confirmation, logger);
        canvas::server::SessionRouter router(verifier, workflow, logger);

        canvas::server::BridgeServer server(config, router, logger);
        server.start();

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        std::signal(SIGHUP, handle_hangup);

        std::cout << "Canvas bridge started on port " << server.port() << ". Press Ctrl+C to stop." << std::endl;
        while (g_should_run.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (g_reopen_log.exchange(false)) {
                try {
                    logger.reopen();
                    logger.info("Log file reopened");
                } catch (const std::exception& ex) {
                    std::cerr << "Unable to reopen log file: " << ex.what() << std::endl;
                }
            }
        }

        std::cout << "Stopping server..." << std::endl;
        server.stop();
        if (transfer_pool.busy() > 0) {
            logger.info("Waiting for " + std::to_string(transfer_pool.busy()) + " course transfers to finish");
        }
        transfer_pool.shutdown();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
