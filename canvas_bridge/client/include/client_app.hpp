#pragma once

#include "messages.hpp"
#include "websocket.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace canvas::client {

// Decides whether a server message ends the current request.
using TerminalRule = std::function<bool(const protocol::Json&)>;

class ClientApp {
public:
    ClientApp();
    ~ClientApp();

    bool connect_to_server(const std::string& host, uint16_t port);
    void run_shell();

private:
    void close_connection();
    bool handshake(const std::string& host, uint16_t port);
    bool send_frame(ws::Opcode opcode, std::string_view payload);
    bool read_message(protocol::Json& message);
    // Sends one request and prints every reply until the terminal one.
    bool exchange(const protocol::Json& request, const TerminalRule& is_terminal);
    void print_message(const protocol::Json& message) const;

    bool authenticate(const std::string& password, const std::string& code);
    bool select(const std::string& key, std::istringstream& args);

    int socket_fd_ = -1;
    std::vector<std::byte> inbound_;
    std::size_t inbound_offset_ = 0;
};

}  // namespace canvas::client
