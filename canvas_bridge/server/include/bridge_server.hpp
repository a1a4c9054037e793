#pragma once

#include "config_loader.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "session.hpp"
#include "session_router.hpp"
#include "task_executor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace canvas::server {

// Single reactor thread owning every socket. Decoded text messages are
// handed to the session pool through a per-connection inbox that is
// drained by at most one task at a time, so each connection is processed
// strictly in arrival order while different connections run in parallel.
class BridgeServer {
public:
    BridgeServer(ServerConfig config, SessionRouter& router, Logger& logger);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    void start();
    void stop();

    // Actual listening port; differs from the configured one when it was 0.
    uint16_t port() const { return bound_port_; }

private:
    struct Connection;
    struct Inbox;
    struct PendingWrite {
        uint64_t connection_id;
        std::vector<std::byte> bytes;
        bool close_after;
    };

    void reactor_loop();
    void handle_accept();
    void handle_event(uint64_t connection_id, uint32_t events);
    bool read_socket(Connection& conn);
    bool process_handshake(Connection& conn);
    bool process_frames(Connection& conn);
    void dispatch_text(Connection& conn, std::string text);
    void drain_inbox(const std::shared_ptr<Inbox>& inbox);

    void queue_bytes(Connection& conn, std::vector<std::byte> bytes, bool close_after = false);
    void schedule_response(uint64_t connection_id, const protocol::Json& message);
    void drain_async_queue();
    bool flush(Connection& conn);
    void watch_output(Connection& conn, bool enabled);
    void close_connection(uint64_t connection_id);

    ServerConfig config_;
    SessionRouter& router_;
    Logger& logger_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    int notify_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread reactor_thread_;
    TaskExecutor session_pool_;

    uint64_t next_connection_id_ = 2;
    std::unordered_map<uint64_t, std::unique_ptr<Connection>> connections_;
    std::mutex async_mutex_;
    std::vector<PendingWrite> async_writes_;
};

}  // namespace canvas::server
