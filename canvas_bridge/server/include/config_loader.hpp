#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace canvas::server {

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8765;
    std::size_t max_clients = 512;
    std::size_t session_threads = 8;
    std::size_t transfer_threads = 4;
    std::size_t max_message_bytes = 1 * 1024 * 1024;

    std::string log_file = "./data/bridge.log";
    std::string log_level = "info";
    std::string database_file = "./data/bridge_state.db";
    std::string download_root = "./file_index";
    std::string report_file = "./file_index/download_report.json";
    std::string mapping_file = "./file_index/vector_stores_mapping.json";

    // Either plaintext or a "$6$" SHA-512 crypt hash.
    std::string auth_password;
    std::string totp_secret;
    bool totp_enabled = true;
    uint32_t totp_step_seconds = 30;
    uint32_t totp_digits = 6;
    uint32_t totp_drift_steps = 1;

    bool interactive_confirmation = false;
    std::set<std::string> upload_extensions = {".pdf", ".txt", ".md",  ".doc",  ".docx", ".ppt",
                                               ".pptx", ".xls", ".xlsx", ".json", ".csv"};
    std::uint64_t max_upload_bytes = 512ULL * 1024 * 1024;

    std::string canvas_url;
    std::string canvas_token;
    std::string openai_api_base = "https://api.openai.com/v1";
    std::string openai_api_key;
    std::string agent_command;
};

ServerConfig load_config(const std::string& path);

// Environment variables win over the file so deployments can keep secrets
// out of it.
void apply_environment(ServerConfig& config);

std::set<std::string> parse_extension_list(const std::string& value);

}  // namespace canvas::server
