#include "client_app.hpp"

#include "encoding.hpp"
#include "socket_utils.hpp"
#include "totp.hpp"

#include <openssl/rand.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace canvas::client {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string{};
}

std::string random_bytes(std::size_t count) {
    std::string bytes(count, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

ws::MaskKey make_mask() {
    const auto bytes = random_bytes(4);
    ws::MaskKey mask{};
    std::copy(bytes.begin(), bytes.end(), mask.begin());
    return mask;
}

bool is_type(const protocol::Json& message, std::string_view type) {
    return protocol::message_type(message) == type;
}

bool is_recoverable_error(const protocol::Json& message) {
    return is_type(message, protocol::kError) && message.value("kind", std::string{}) != "FatalError";
}

// A download job ends with a summary; a selection without auto-confirm ends
// with a confirmation request.
bool ends_selection(const protocol::Json& message) {
    return is_type(message, protocol::kSummary) || is_type(message, protocol::kConfirmation) ||
           is_type(message, protocol::kStatus) || is_recoverable_error(message);
}

TerminalRule ends_with(std::string_view type) {
    return [type](const protocol::Json& message) {
        return is_type(message, type) || is_type(message, protocol::kError);
    };
}

bool is_small_number(const std::string& token) {
    return !token.empty() && token.size() < 10 &&
           std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

ClientApp::ClientApp() = default;

ClientApp::~ClientApp() {
    close_connection();
}

bool ClientApp::connect_to_server(const std::string& host, uint16_t port) {
    close_connection();
    socket_fd_ = net::connect_tcp(host, port);
    if (socket_fd_ < 0) {
        std::cerr << "Unable to connect to server" << std::endl;
        return false;
    }
    inbound_.clear();
    inbound_offset_ = 0;
    if (!handshake(host, port)) {
        std::cerr << "WebSocket handshake failed" << std::endl;
        close_connection();
        return false;
    }
    return true;
}

bool ClientApp::handshake(const std::string& host, uint16_t port) {
    const auto key = util::base64_encode(random_bytes(16));
    const auto request = ws::make_client_handshake(host, port, "/", key);
    if (!net::send_all(socket_fd_, request.data(), request.size())) {
        return false;
    }
    ws::HttpHead head;
    while (!ws::try_parse_head(inbound_, inbound_offset_, head)) {
        if (!net::recv_some(socket_fd_, inbound_)) {
            return false;
        }
    }
    return ws::verify_handshake_response(head, key);
}

void ClientApp::close_connection() {
    if (socket_fd_ >= 0) {
        try {
            // The peer may already be gone; the socket is closed either way.
            if (!net::send_all(socket_fd_, ws::encode_close(ws::kCloseNormal, "", make_mask()))) {
                std::cerr << "Close frame not delivered" << std::endl;
            }
        } catch (const std::runtime_error& ex) {
            std::cerr << "Close frame not sent: " << ex.what() << std::endl;
        }
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool ClientApp::send_frame(ws::Opcode opcode, std::string_view payload) {
    if (socket_fd_ < 0) {
        return false;
    }
    return net::send_all(socket_fd_, ws::encode_frame(opcode, payload, make_mask()));
}

bool ClientApp::read_message(protocol::Json& message) {
    ws::Frame frame;
    std::string assembled;
    while (true) {
        bool decoded = false;
        try {
            decoded = ws::try_decode_frame(inbound_, inbound_offset_, frame, 64 * 1024 * 1024);
        } catch (const std::exception& ex) {
            std::cerr << "Malformed frame from server: " << ex.what() << std::endl;
            return false;
        }
        if (!decoded) {
            if (!net::recv_some(socket_fd_, inbound_)) {
                return false;
            }
            continue;
        }
        switch (frame.opcode) {
            case ws::Opcode::kPing:
                if (!send_frame(ws::Opcode::kPong, frame.payload)) {
                    return false;
                }
                continue;
            case ws::Opcode::kPong:
                continue;
            case ws::Opcode::kClose:
                return false;
            default:
                break;
        }
        assembled += frame.payload;
        if (!frame.fin) {
            continue;
        }
        message = protocol::Json::parse(assembled, nullptr, false);
        if (message.is_discarded()) {
            std::cerr << "Server sent invalid JSON" << std::endl;
            assembled.clear();
            continue;
        }
        return true;
    }
}

void ClientApp::print_message(const protocol::Json& message) const {
    const auto type = protocol::message_type(message);
    if (type == protocol::kChatResult) {
        std::cout << message.value("text", std::string{}) << std::endl;
    } else if (type == protocol::kRoster) {
        const auto entries = message.value("entries", protocol::Json::array());
        if (entries.empty()) {
            std::cout << "No active courses." << std::endl;
        }
        for (const auto& entry : entries) {
            std::cout << "  [" << entry.value("index", 0) << "] " << entry.value("course_id", std::string{}) << "  "
                      << entry.value("name", std::string{}) << " (" << entry.value("code", std::string{}) << ")"
                      << std::endl;
        }
    } else if (type == protocol::kProgress) {
        std::cout << "progress " << message.value("course_id", std::string{})
                  << ": downloaded=" << message.value("downloaded", 0) << " skipped=" << message.value("skipped", 0)
                  << " failed=" << message.value("failed", 0) << " uploaded=" << message.value("uploaded", 0)
                  << std::endl;
    } else if (type == protocol::kConfirmation) {
        std::cout << "Confirm download of:" << std::endl;
        for (const auto& course : message.value("courses", protocol::Json::array())) {
            std::cout << "  " << course.value("course_id", std::string{}) << "  "
                      << course.value("name", std::string{}) << std::endl;
        }
        std::cout << "Type 'confirm' or 'reject'." << std::endl;
    } else if (type == protocol::kError) {
        std::cout << message.value("kind", std::string{"Error"}) << ": " << message.value("message", std::string{})
                  << std::endl;
    } else {
        std::cout << message.dump(2) << std::endl;
    }
}

bool ClientApp::exchange(const protocol::Json& request, const TerminalRule& is_terminal) {
    if (!send_frame(ws::Opcode::kText, protocol::serialize(request))) {
        return false;
    }
    protocol::Json reply;
    while (read_message(reply)) {
        print_message(reply);
        if (is_terminal(reply)) {
            return true;
        }
    }
    return false;
}

bool ClientApp::authenticate(const std::string& password, const std::string& code) {
    return exchange({{"type", protocol::kAuth}, {"password", password}, {"totp", code}}, ends_with(protocol::kStatus));
}

bool ClientApp::select(const std::string& key, std::istringstream& args) {
    auto values = protocol::Json::array();
    std::optional<bool> auto_confirm;
    std::string token;
    while (args >> token) {
        if (token == "--auto") {
            auto_confirm = true;
        } else if (token == "--ask") {
            auto_confirm = false;
        } else if (key == "course_indices" && is_small_number(token)) {
            values.push_back(std::stoi(token));
        } else {
            values.push_back(token);
        }
    }
    protocol::Json request{{"type", protocol::kDownload}, {key, std::move(values)}};
    if (auto_confirm) {
        request["auto_confirm"] = *auto_confirm;
    }
    return exchange(request, ends_selection);
}

void ClientApp::run_shell() {
    if (socket_fd_ < 0) {
        std::cerr << "Connect to server first" << std::endl;
        return;
    }

    std::cout << "Type 'help' for available commands." << std::endl;
    std::string input;
    while (true) {
        std::cout << "canvas> " << std::flush;
        if (!std::getline(std::cin, input)) {
            break;
        }
        if (input.empty()) {
            continue;
        }
        std::istringstream iss(input);
        std::string command;
        iss >> command;
        std::transform(command.begin(), command.end(), command.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        bool alive = true;
        if (command == "help") {
            std::cout << "Commands:\n"
                      << "  auth [password] [totp]   (defaults: CANVAS_WS_SECRET, code from CANVAS_WS_TOTP_SECRET)\n"
                      << "  chat <question>\n"
                      << "  download                 list courses\n"
                      << "  select <index>... [--auto|--ask]\n"
                      << "  ids <course_id>... [--auto|--ask]\n"
                      << "  confirm | reject | cancel\n"
                      << "  quit" << std::endl;
            continue;
        } else if (command == "quit") {
            break;
        } else if (command == "auth") {
            std::string password;
            std::string code;
            iss >> password >> code;
            if (password.empty()) {
                password = env_or_empty("CANVAS_WS_SECRET");
            }
            if (code.empty()) {
                const auto seed = env_or_empty("CANVAS_WS_TOTP_SECRET");
                if (!seed.empty()) {
                    try {
                        code = totp::code_at(util::base32_decode(seed), std::time(nullptr));
                    } catch (const std::exception& ex) {
                        std::cout << "Cannot derive TOTP code: " << ex.what() << std::endl;
                        continue;
                    }
                }
            }
            alive = authenticate(password, code);
        } else if (command == "chat") {
            std::string query;
            std::getline(iss >> std::ws, query);
            if (query.empty()) {
                std::cout << "Usage: chat <question>" << std::endl;
                continue;
            }
            alive = exchange({{"type", protocol::kChat}, {"query", query}}, ends_with(protocol::kChatResult));
        } else if (command == "download") {
            alive = exchange({{"type", protocol::kDownload}}, ends_with(protocol::kRoster));
        } else if (command == "select") {
            alive = select("course_indices", iss);
        } else if (command == "ids") {
            alive = select("course_ids", iss);
        } else if (command == "confirm" || command == "reject") {
            alive = exchange({{"type", protocol::kDownload}, {"confirm", command == "confirm"}}, ends_selection);
        } else if (command == "cancel") {
            alive = exchange({{"type", protocol::kCancel}}, ends_with(protocol::kStatus));
        } else {
            std::cout << "Unknown command. Type 'help'." << std::endl;
            continue;
        }

        if (!alive) {
            std::cout << "Connection lost." << std::endl;
            break;
        }
    }
    close_connection();
}

}  // namespace canvas::client
