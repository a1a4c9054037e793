#pragma once

#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace canvas::net {

inline bool send_all(int fd, const void* buffer, size_t length) {
    const auto* data = static_cast<const std::byte*>(buffer);
    size_t total_sent = 0;
    while (total_sent < length) {
        ssize_t sent = ::send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

inline bool send_all(int fd, const std::vector<std::byte>& buffer) {
    return send_all(fd, buffer.data(), buffer.size());
}

// Appends whatever is available (blocking for at least one byte) to buffer.
inline bool recv_some(int fd, std::vector<std::byte>& buffer) {
    std::byte chunk[16 * 1024];
    while (true) {
        const ssize_t received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        buffer.insert(buffer.end(), chunk, chunk + received);
        return true;
    }
}

// Blocking TCP connect; returns -1 when no resolved address accepts.
inline int connect_tcp(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    if (::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result) != 0) {
        return -1;
    }
    int fd = -1;
    for (addrinfo* ptr = result; ptr != nullptr; ptr = ptr->ai_next) {
        fd = ::socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, ptr->ai_addr, ptr->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(result);
    return fd;
}

inline int set_non_blocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return -1;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

inline void set_socket_keepalive(int fd) {
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
}

}  // namespace canvas::net
