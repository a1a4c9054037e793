#include "client_app.hpp"

#include <cstdint>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: canvas_bridge_client <host> <port>" << std::endl;
        return 1;
    }

    const std::string host = argv[1];

    try {
        const auto port = static_cast<uint16_t>(std::stoi(argv[2]));
        canvas::client::ClientApp app;
        if (!app.connect_to_server(host, port)) {
            return 1;
        }
        app.run_shell();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
