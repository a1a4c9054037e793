#include "bridge_server.hpp"

#include "socket_utils.hpp"
#include "websocket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace canvas::server {

namespace {

constexpr int kMaxEvents = 128;
constexpr uint64_t kListenerId = 0;
constexpr uint64_t kNotifyId = 1;

std::vector<std::byte> to_bytes(const std::string& text) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                  reinterpret_cast<const std::byte*>(text.data() + text.size()));
}

void wake(int notify_fd) {
    uint64_t value = 1;
    // eventfd writes only fail when the counter would overflow, which still
    // leaves it readable.
    [[maybe_unused]] const auto written = ::write(notify_fd, &value, sizeof(value));
}

}  // namespace

struct BridgeServer::Inbox {
    explicit Inbox(std::unique_ptr<Session> owned) : session(std::move(owned)) {}

    std::unique_ptr<Session> session;
    std::mutex mutex;
    std::deque<std::string> messages;
    bool draining = false;
};

struct BridgeServer::Connection {
    int fd = -1;
    uint64_t id = 0;
    std::string peer;
    std::vector<std::byte> inbound;
    std::size_t inbound_offset = 0;
    std::vector<std::byte> outbound;
    bool handshake_done = false;
    bool close_after_flush = false;
    bool output_watched = false;

    ws::Opcode fragment_opcode = ws::Opcode::kText;
    std::string fragments;
    bool in_fragment = false;

    std::shared_ptr<Inbox> inbox;
};

BridgeServer::BridgeServer(ServerConfig config, SessionRouter& router, Logger& logger)
    : config_(std::move(config)), router_(router), logger_(logger), session_pool_("session") {}

BridgeServer::~BridgeServer() {
    stop();
}

void BridgeServer::start() {
    if (running_) {
        return;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }
    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.listen_port);
    if (::inet_pton(AF_INET, config_.listen_address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + config_.listen_address);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("Failed to bind " + config_.listen_address + ":" +
                                 std::to_string(config_.listen_port) + ": " + std::strerror(errno));
    }
    if (::listen(server_fd_, static_cast<int>(config_.max_clients)) < 0) {
        throw std::runtime_error("Failed to listen on server socket");
    }
    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    ::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len);
    bound_port_ = ntohs(bound.sin_port);
    net::set_non_blocking(server_fd_);

    epoll_fd_ = ::epoll_create1(0);
    if (epoll_fd_ < 0) {
        throw std::runtime_error("Failed to create epoll");
    }
    notify_fd_ = ::eventfd(0, EFD_NONBLOCK);
    if (notify_fd_ < 0) {
        throw std::runtime_error("Failed to create eventfd");
    }

    epoll_event server_event{};
    server_event.data.u64 = kListenerId;
    server_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &server_event);

    epoll_event notify_event{};
    notify_event.data.u64 = kNotifyId;
    notify_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, notify_fd_, &notify_event);

    session_pool_.start(config_.session_threads);

    running_ = true;
    reactor_thread_ = std::thread(&BridgeServer::reactor_loop, this);
    logger_.info("Bridge listening on " + config_.listen_address + ":" + std::to_string(bound_port_));
}

void BridgeServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    wake(notify_fd_);
    if (reactor_thread_.joinable()) {
        reactor_thread_.join();
    }

    for (auto& [id, conn] : connections_) {
        conn->inbox->session->cancel();
        ::close(conn->fd);
    }
    connections_.clear();

    // Running jobs observe their cancel flags and return; queued messages
    // are still routed but their responses are dropped.
    const auto queued = session_pool_.queued();
    if (queued > 0 || session_pool_.busy() > 0) {
        logger_.info("Waiting for " + std::to_string(session_pool_.busy()) + " running and " +
                     std::to_string(queued) + " queued session tasks");
    }
    session_pool_.shutdown();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (notify_fd_ >= 0) {
        ::close(notify_fd_);
        notify_fd_ = -1;
    }
    logger_.info("Bridge stopped");
}

void BridgeServer::reactor_loop() {
    std::array<epoll_event, kMaxEvents> events{};

    while (running_) {
        const int ready = ::epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()), 500);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error("epoll_wait failed: " + std::string(std::strerror(errno)));
            break;
        }
        for (int i = 0; i < ready; ++i) {
            const auto& event = events[static_cast<std::size_t>(i)];
            if (event.data.u64 == kListenerId) {
                handle_accept();
                continue;
            }
            if (event.data.u64 == kNotifyId) {
                uint64_t tmp;
                [[maybe_unused]] const auto consumed = ::read(notify_fd_, &tmp, sizeof(tmp));
                drain_async_queue();
                continue;
            }
            handle_event(event.data.u64, event.events);
        }
    }
}

void BridgeServer::handle_accept() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        const int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &len);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            logger_.warn("accept failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (connections_.size() >= config_.max_clients) {
            logger_.warn("Connection limit reached, refusing client");
            ::close(client_fd);
            continue;
        }
        net::set_non_blocking(client_fd);
        net::set_socket_keepalive(client_fd);

        const uint64_t id = next_connection_id_++;
        epoll_event event{};
        event.data.u64 = id;
        event.events = EPOLLIN | EPOLLRDHUP;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &event) < 0) {
            ::close(client_fd);
            continue;
        }

        char address[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &client_addr.sin_addr, address, sizeof(address));
        std::ostringstream peer;
        peer << address << ":" << ntohs(client_addr.sin_port);

        auto conn = std::make_unique<Connection>();
        conn->fd = client_fd;
        conn->id = id;
        conn->peer = peer.str();
        conn->inbox = std::make_shared<Inbox>(std::make_unique<Session>(id, conn->peer));
        logger_.info(conn->inbox->session->tag() + " accepted from " + conn->peer);
        connections_.emplace(id, std::move(conn));
    }
}

void BridgeServer::handle_event(uint64_t connection_id, uint32_t events) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    auto& conn = *it->second;

    if (events & EPOLLERR) {
        close_connection(connection_id);
        return;
    }

    if (events & EPOLLIN) {
        if (!read_socket(conn)) {
            close_connection(connection_id);
            return;
        }
        bool keep = conn.handshake_done || conn.close_after_flush || process_handshake(conn);
        if (keep && conn.handshake_done && !conn.close_after_flush) {
            keep = process_frames(conn);
        }
        if (!keep) {
            close_connection(connection_id);
            return;
        }
    } else if (events & (EPOLLHUP | EPOLLRDHUP)) {
        close_connection(connection_id);
        return;
    }

    if (events & EPOLLOUT) {
        if (!flush(conn)) {
            close_connection(connection_id);
        }
    }
}

// Returns false once the peer has gone away.
bool BridgeServer::read_socket(Connection& conn) {
    std::array<std::byte, 64 * 1024> buf{};
    while (true) {
        const ssize_t received = ::recv(conn.fd, buf.data(), buf.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (received == 0) {
            return false;
        }
        conn.inbound.insert(conn.inbound.end(), buf.begin(), buf.begin() + received);
    }
}

bool BridgeServer::process_handshake(Connection& conn) {
    ws::HttpHead head;
    try {
        if (!ws::try_parse_head(conn.inbound, conn.inbound_offset, head)) {
            return true;
        }
        queue_bytes(conn, to_bytes(ws::make_handshake_response(head)));
    } catch (const std::exception& ex) {
        logger_.warn("conn#" + std::to_string(conn.id) + " rejected handshake from " + conn.peer + ": " + ex.what());
        queue_bytes(conn, to_bytes(ws::make_rejection(ex.what())), true);
        return true;
    }
    conn.handshake_done = true;
    logger_.debug("conn#" + std::to_string(conn.id) + " upgraded to WebSocket");
    return true;
}

bool BridgeServer::process_frames(Connection& conn) {
    ws::Frame frame;
    while (true) {
        try {
            if (!ws::try_decode_frame(conn.inbound, conn.inbound_offset, frame, config_.max_message_bytes)) {
                return true;
            }
        } catch (const std::length_error& ex) {
            logger_.warn("conn#" + std::to_string(conn.id) + " " + ex.what());
            queue_bytes(conn, ws::encode_close(ws::kCloseTooBig, "Message too big"), true);
            return true;
        } catch (const std::runtime_error& ex) {
            logger_.warn("conn#" + std::to_string(conn.id) + " " + ex.what());
            queue_bytes(conn, ws::encode_close(ws::kCloseProtocolError, ex.what()), true);
            return true;
        }

        if (!frame.masked) {
            queue_bytes(conn, ws::encode_close(ws::kCloseProtocolError, "Client frames must be masked"), true);
            return true;
        }

        switch (frame.opcode) {
            case ws::Opcode::kPing:
                queue_bytes(conn, ws::encode_frame(ws::Opcode::kPong, frame.payload));
                continue;
            case ws::Opcode::kPong:
                continue;
            case ws::Opcode::kClose: {
                uint16_t code = ws::kCloseNormal;
                if (frame.payload.size() >= 2) {
                    code = static_cast<uint16_t>((static_cast<unsigned char>(frame.payload[0]) << 8) |
                                                 static_cast<unsigned char>(frame.payload[1]));
                }
                queue_bytes(conn, ws::encode_close(code, ""), true);
                return true;
            }
            case ws::Opcode::kContinuation:
                if (!conn.in_fragment) {
                    queue_bytes(conn, ws::encode_close(ws::kCloseProtocolError, "Unexpected continuation"), true);
                    return true;
                }
                break;
            case ws::Opcode::kText:
            case ws::Opcode::kBinary:
                if (conn.in_fragment) {
                    queue_bytes(conn, ws::encode_close(ws::kCloseProtocolError, "Interleaved message"), true);
                    return true;
                }
                conn.in_fragment = true;
                conn.fragment_opcode = frame.opcode;
                conn.fragments.clear();
                break;
        }

        if (conn.fragments.size() + frame.payload.size() > config_.max_message_bytes) {
            queue_bytes(conn, ws::encode_close(ws::kCloseTooBig, "Message too big"), true);
            return true;
        }
        conn.fragments += frame.payload;
        if (!frame.fin) {
            continue;
        }

        conn.in_fragment = false;
        std::string message;
        message.swap(conn.fragments);
        if (conn.fragment_opcode == ws::Opcode::kBinary) {
            schedule_response(conn.id,
                              SessionRouter::error_message(ErrorKind::kProtocol, "Binary messages are not supported."));
            continue;
        }
        dispatch_text(conn, std::move(message));
    }
}

void BridgeServer::dispatch_text(Connection& conn, std::string text) {
    auto inbox = conn.inbox;
    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(inbox->mutex);
        inbox->messages.push_back(std::move(text));
        if (!inbox->draining) {
            inbox->draining = true;
            start_drain = true;
        }
    }
    if (start_drain) {
        // The drain result carries nothing; failures are reported inside.
        session_pool_.submit([this, inbox]() { drain_inbox(inbox); });
    }
}

void BridgeServer::drain_inbox(const std::shared_ptr<Inbox>& inbox) {
    auto& session = *inbox->session;
    const auto connection_id = session.id();
    const Emit emit = [this, connection_id](const protocol::Json& message) {
        schedule_response(connection_id, message);
    };
    while (true) {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(inbox->mutex);
            if (inbox->messages.empty() || session.cancelled()) {
                inbox->messages.clear();
                inbox->draining = false;
                return;
            }
            text = std::move(inbox->messages.front());
            inbox->messages.pop_front();
        }
        router_.handle_text(session, text, emit);
    }
}

void BridgeServer::queue_bytes(Connection& conn, std::vector<std::byte> bytes, bool close_after) {
    conn.outbound.insert(conn.outbound.end(), bytes.begin(), bytes.end());
    if (close_after) {
        conn.close_after_flush = true;
    }
    watch_output(conn, true);
}

void BridgeServer::schedule_response(uint64_t connection_id, const protocol::Json& message) {
    auto frame = ws::encode_frame(ws::Opcode::kText, protocol::serialize(message));
    std::lock_guard<std::mutex> lock(async_mutex_);
    if (notify_fd_ < 0) {
        return;
    }
    async_writes_.push_back(PendingWrite{connection_id, std::move(frame), false});
    wake(notify_fd_);
}

void BridgeServer::drain_async_queue() {
    std::vector<PendingWrite> pending;
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        pending.swap(async_writes_);
    }
    for (auto& write : pending) {
        auto it = connections_.find(write.connection_id);
        if (it == connections_.end() || it->second->close_after_flush) {
            continue;
        }
        queue_bytes(*it->second, std::move(write.bytes), write.close_after);
    }
}

// Returns false when the socket failed or the connection should now close.
bool BridgeServer::flush(Connection& conn) {
    std::size_t sent_total = 0;
    while (sent_total < conn.outbound.size()) {
        const ssize_t sent = ::send(conn.fd, conn.outbound.data() + sent_total, conn.outbound.size() - sent_total,
                                    MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    conn.outbound.erase(conn.outbound.begin(), conn.outbound.begin() + static_cast<std::ptrdiff_t>(sent_total));
    if (!conn.outbound.empty()) {
        return true;
    }
    if (conn.close_after_flush) {
        return false;
    }
    watch_output(conn, false);
    return true;
}

void BridgeServer::watch_output(Connection& conn, bool enabled) {
    if (conn.output_watched == enabled) {
        return;
    }
    epoll_event ev{};
    ev.data.u64 = conn.id;
    ev.events = EPOLLIN | EPOLLRDHUP | (enabled ? EPOLLOUT : 0u);
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, conn.fd, &ev);
    conn.output_watched = enabled;
}

void BridgeServer::close_connection(uint64_t connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return;
    }
    auto& conn = *it->second;
    conn.inbox->session->cancel();
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, conn.fd, nullptr);
    ::close(conn.fd);
    logger_.info(conn.inbox->session->tag() + " closed (" + conn.peer + ")");
    connections_.erase(it);
}

}  // namespace canvas::server
