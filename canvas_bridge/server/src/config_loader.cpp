#include "config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace canvas::server {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_bool(const std::string& value) {
    const auto normalized = lower(trim(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

}

std::set<std::string> parse_extension_list(const std::string& value) {
    std::set<std::string> extensions;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = lower(trim(item));
        if (item.empty()) {
            continue;
        }
        if (item[0] != '.') {
            item.insert(item.begin(), '.');
        }
        extensions.insert(item);
    }
    return extensions;
}

ServerConfig load_config(const std::string& path) {
    ServerConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "listen_address") {
            config.listen_address = value;
        } else if (key == "listen_port") {
            config.listen_port = static_cast<uint16_t>(std::stoi(value));
        } else if (key == "max_clients") {
            config.max_clients = static_cast<std::size_t>(std::stoul(value));
        } else if (key == "session_threads") {
            config.session_threads = static_cast<std::size_t>(std::stoul(value));
        } else if (key == "transfer_threads") {
            config.transfer_threads = static_cast<std::size_t>(std::stoul(value));
        } else if (key == "max_message_bytes") {
            config.max_message_bytes = static_cast<std::size_t>(std::stoul(value));
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = lower(value);
        } else if (key == "database_file") {
            config.database_file = value;
        } else if (key == "download_root") {
            config.download_root = value;
        } else if (key == "report_file") {
            config.report_file = value;
        } else if (key == "mapping_file") {
            config.mapping_file = value;
        } else if (key == "auth_password") {
            config.auth_password = value;
        } else if (key == "totp_secret") {
            config.totp_secret = value;
        } else if (key == "totp_enabled") {
            config.totp_enabled = parse_bool(value);
        } else if (key == "totp_step_seconds") {
            config.totp_step_seconds = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "totp_digits") {
            config.totp_digits = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "totp_drift_steps") {
            config.totp_drift_steps = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "interactive_confirmation") {
            config.interactive_confirmation = parse_bool(value);
        } else if (key == "upload_extensions") {
            config.upload_extensions = parse_extension_list(value);
        } else if (key == "max_upload_bytes") {
            config.max_upload_bytes = static_cast<std::uint64_t>(std::stoull(value));
        } else if (key == "canvas_url") {
            config.canvas_url = value;
        } else if (key == "canvas_token") {
            config.canvas_token = value;
        } else if (key == "openai_api_base") {
            config.openai_api_base = value;
        } else if (key == "openai_api_key") {
            config.openai_api_key = value;
        } else if (key == "agent_command") {
            config.agent_command = value;
        }
    }

    return config;
}

void apply_environment(ServerConfig& config) {
    if (const char* value = env("CANVAS_WS_HOST")) {
        config.listen_address = value;
    }
    if (const char* value = env("CANVAS_WS_PORT")) {
        config.listen_port = static_cast<uint16_t>(std::stoi(value));
    }
    if (const char* value = env("CANVAS_WS_SECRET")) {
        config.auth_password = value;
    }
    if (const char* value = env("CANVAS_WS_TOTP_SECRET")) {
        config.totp_secret = value;
    }
    if (const char* value = env("CANVAS_WS_TOTP_DISABLED")) {
        config.totp_enabled = !parse_bool(value);
    }
    if (const char* value = env("CANVAS_URL")) {
        config.canvas_url = value;
    }
    if (const char* value = env("CANVAS_ACCESS_TOKEN")) {
        config.canvas_token = value;
    }
    if (const char* value = env("OPENAI_API_KEY")) {
        config.openai_api_key = value;
    }
    if (const char* value = env("CANVAS_AGENT_COMMAND")) {
        config.agent_command = value;
    }
    while (!config.canvas_url.empty() && config.canvas_url.back() == '/') {
        config.canvas_url.pop_back();
    }
}

}  // namespace canvas::server
