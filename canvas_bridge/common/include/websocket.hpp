#pragma once

#include "encoding.hpp"

#include <arpa/inet.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace canvas::ws {

inline constexpr std::string_view kHandshakeGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
inline constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;

enum class Opcode : uint8_t {
    kContinuation = 0x0,
    kText = 0x1,
    kBinary = 0x2,
    kClose = 0x8,
    kPing = 0x9,
    kPong = 0xA,
};

inline constexpr uint16_t kCloseNormal = 1000;
inline constexpr uint16_t kCloseProtocolError = 1002;
inline constexpr uint16_t kCloseTooBig = 1009;

using MaskKey = std::array<unsigned char, 4>;

struct Frame {
    bool fin = true;
    bool masked = false;
    Opcode opcode = Opcode::kText;
    std::string payload;
};

// Header names are stored lower-cased.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpHead {
    std::string start_line;
    HeaderMap headers;
};

namespace detail {

inline std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline HttpHead parse_head(std::string_view data) {
    HttpHead head;
    std::size_t start = 0;
    bool first_line = true;
    while (start < data.size()) {
        auto end = data.find("\r\n", start);
        if (end == std::string_view::npos) {
            end = data.size();
        }
        const auto line = data.substr(start, end - start);
        if (first_line) {
            head.start_line = std::string(line);
            first_line = false;
        } else if (!line.empty()) {
            const auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                head.headers[to_lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
            }
        }
        start = end + 2;
    }
    return head;
}

inline void apply_mask(std::string& payload, const MaskKey& key) {
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(static_cast<unsigned char>(payload[i]) ^ key[i % 4]);
    }
}

inline void compact(std::vector<std::byte>& buffer, std::size_t& offset) {
    if (offset > 0 && offset > buffer.size() / 2) {
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
        offset = 0;
    }
}

}  // namespace detail

inline std::string accept_key(std::string_view client_key) {
    const std::string material = std::string(client_key) + std::string(kHandshakeGuid);
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest.data());
    return util::base64_encode(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

inline std::string header_value(const HttpHead& head, const std::string& key) {
    auto it = head.headers.find(detail::to_lower(key));
    if (it == head.headers.end()) {
        return {};
    }
    return it->second;
}

// Matches one token of a comma separated header such as "keep-alive, Upgrade".
inline bool header_has_token(const HttpHead& head, const std::string& key, std::string_view token) {
    const auto value = detail::to_lower(header_value(head, key));
    const auto wanted = detail::to_lower(token);
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (detail::trim(std::string_view(value).substr(start, end - start)) == wanted) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

// Extracts one HTTP head terminated by an empty line. Returns false until the
// whole head has been buffered.
inline bool try_parse_head(std::vector<std::byte>& buffer, std::size_t& offset, HttpHead& out) {
    const std::string_view view(reinterpret_cast<const char*>(buffer.data()) + offset, buffer.size() - offset);
    const auto end = view.find("\r\n\r\n");
    if (end == std::string_view::npos) {
        if (view.size() > kMaxHandshakeBytes) {
            throw std::runtime_error("Handshake exceeds size limit");
        }
        return false;
    }
    out = detail::parse_head(view.substr(0, end));
    offset += end + 4;
    detail::compact(buffer, offset);
    return true;
}

inline std::string make_handshake_response(const HttpHead& request) {
    if (request.start_line.rfind("GET ", 0) != 0) {
        throw std::invalid_argument("Handshake must be a GET request");
    }
    if (!header_has_token(request, "upgrade", "websocket") || !header_has_token(request, "connection", "upgrade")) {
        throw std::invalid_argument("Missing upgrade headers");
    }
    if (header_value(request, "sec-websocket-version") != "13") {
        throw std::invalid_argument("Unsupported WebSocket version");
    }
    const auto key = header_value(request, "sec-websocket-key");
    if (key.empty()) {
        throw std::invalid_argument("Missing Sec-WebSocket-Key");
    }
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " +
           accept_key(key) + "\r\n\r\n";
}

inline std::string make_rejection(std::string_view reason) {
    std::string body(reason);
    return "HTTP/1.1 400 Bad Request\r\n"
           "Content-Type: text/plain\r\n"
           "Connection: close\r\n"
           "Content-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

inline std::string make_client_handshake(const std::string& host, uint16_t port, const std::string& path,
                                         const std::string& key) {
    return "GET " + path + " HTTP/1.1\r\n"
           "Host: " + host + ":" + std::to_string(port) + "\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Key: " + key + "\r\n"
           "Sec-WebSocket-Version: 13\r\n\r\n";
}

inline bool verify_handshake_response(const HttpHead& response, const std::string& key) {
    if (response.start_line.find(" 101") == std::string::npos) {
        return false;
    }
    return header_value(response, "sec-websocket-accept") == accept_key(key);
}

inline std::vector<std::byte> encode_frame(Opcode opcode, std::string_view payload,
                                           const std::optional<MaskKey>& mask = std::nullopt, bool fin = true) {
    std::vector<std::byte> buffer;
    buffer.reserve(payload.size() + 14);
    buffer.push_back(static_cast<std::byte>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    const uint8_t mask_bit = mask ? 0x80 : 0x00;
    if (payload.size() < 126) {
        buffer.push_back(static_cast<std::byte>(mask_bit | static_cast<uint8_t>(payload.size())));
    } else if (payload.size() <= 0xFFFF) {
        buffer.push_back(static_cast<std::byte>(mask_bit | 126));
        const uint16_t len = htons(static_cast<uint16_t>(payload.size()));
        const auto* raw = reinterpret_cast<const std::byte*>(&len);
        buffer.insert(buffer.end(), raw, raw + sizeof(len));
    } else {
        buffer.push_back(static_cast<std::byte>(mask_bit | 127));
        uint64_t len = payload.size();
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<std::byte>((len >> shift) & 0xFF));
        }
    }

    std::string body(payload);
    if (mask) {
        for (unsigned char b : *mask) {
            buffer.push_back(static_cast<std::byte>(b));
        }
        detail::apply_mask(body, *mask);
    }
    const auto* raw = reinterpret_cast<const std::byte*>(body.data());
    buffer.insert(buffer.end(), raw, raw + body.size());
    return buffer;
}

inline std::vector<std::byte> encode_close(uint16_t code, std::string_view reason,
                                           const std::optional<MaskKey>& mask = std::nullopt) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload.append(reason.substr(0, 123));
    return encode_frame(Opcode::kClose, payload, mask);
}

inline bool is_control(Opcode opcode) {
    return (static_cast<uint8_t>(opcode) & 0x08) != 0;
}

// Decodes one frame starting at offset. Returns false while the frame is
// incomplete; throws on protocol violations or when the payload is larger
// than max_payload.
inline bool try_decode_frame(std::vector<std::byte>& buffer, std::size_t& offset, Frame& out,
                             std::size_t max_payload) {
    const auto available = buffer.size() - offset;
    if (available < 2) {
        return false;
    }
    const auto* data = reinterpret_cast<const unsigned char*>(buffer.data()) + offset;

    const uint8_t b0 = data[0];
    const uint8_t b1 = data[1];
    if ((b0 & 0x70) != 0) {
        throw std::runtime_error("Reserved frame bits set");
    }
    const auto opcode = static_cast<Opcode>(b0 & 0x0F);
    switch (opcode) {
        case Opcode::kContinuation:
        case Opcode::kText:
        case Opcode::kBinary:
        case Opcode::kClose:
        case Opcode::kPing:
        case Opcode::kPong:
            break;
        default:
            throw std::runtime_error("Unknown frame opcode");
    }
    const bool fin = (b0 & 0x80) != 0;
    const bool masked = (b1 & 0x80) != 0;

    std::size_t header_size = 2;
    uint64_t length = b1 & 0x7F;
    if (length == 126) {
        if (available < 4) {
            return false;
        }
        length = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_size = 4;
    } else if (length == 127) {
        if (available < 10) {
            return false;
        }
        length = 0;
        for (int i = 0; i < 8; ++i) {
            length = (length << 8) | data[2 + i];
        }
        header_size = 10;
    }
    if (is_control(opcode) && (!fin || length > 125)) {
        throw std::runtime_error("Malformed control frame");
    }
    if (length > max_payload) {
        throw std::length_error("Frame exceeds size limit");
    }

    MaskKey key{};
    if (masked) {
        if (available < header_size + 4) {
            return false;
        }
        std::memcpy(key.data(), data + header_size, 4);
        header_size += 4;
    }

    const std::size_t frame_size = header_size + static_cast<std::size_t>(length);
    if (available < frame_size) {
        return false;
    }

    out.fin = fin;
    out.masked = masked;
    out.opcode = opcode;
    out.payload.assign(reinterpret_cast<const char*>(data + header_size), static_cast<std::size_t>(length));
    if (masked) {
        detail::apply_mask(out.payload, key);
    }

    offset += frame_size;
    detail::compact(buffer, offset);
    return true;
}

}  // namespace canvas::ws
