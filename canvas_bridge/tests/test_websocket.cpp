#include "http_client.hpp"
#include "messages.hpp"
#include "test_support.hpp"
#include "websocket.hpp"

#include <iostream>

using canvas::test::assert_true;
namespace ws = canvas::ws;
namespace protocol = canvas::protocol;

namespace {

std::vector<std::byte> to_bytes(const std::string& text) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                  reinterpret_cast<const std::byte*>(text.data() + text.size()));
}

const ws::MaskKey kMask{0x37, 0xfa, 0x21, 0x3d};

void test_accept_key() {
    assert_true(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGJRwNHUDJT7g=",
                "RFC 6455 sample accept key");
}

void test_server_handshake() {
    auto buffer = to_bytes(
        "GET /chat HTTP/1.1\r\nHost: server.example.com\r\nUpgrade: websocket\r\n"
        "Connection: keep-alive, Upgrade\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n\r\n");
    std::size_t offset = 0;
    ws::HttpHead head;
    assert_true(ws::try_parse_head(buffer, offset, head), "complete head parses");
    assert_true(ws::header_value(head, "host") == "server.example.com", "headers are case-insensitive");
    const auto response = ws::make_handshake_response(head);
    assert_true(response.rfind("HTTP/1.1 101", 0) == 0, "101 status line");
    assert_true(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGJRwNHUDJT7g=") != std::string::npos,
                "accept header present");

    auto partial = to_bytes("GET / HTTP/1.1\r\nHost: x\r\n");
    offset = 0;
    assert_true(!ws::try_parse_head(partial, offset, head), "incomplete head waits for more bytes");

    auto plain = to_bytes("GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    offset = 0;
    assert_true(ws::try_parse_head(plain, offset, head), "plain HTTP head parses");
    bool threw = false;
    try {
        ws::make_handshake_response(head);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert_true(threw, "request without upgrade headers is rejected");
    assert_true(ws::make_rejection("bad").rfind("HTTP/1.1 400", 0) == 0, "rejection is a 400");
}

void test_client_handshake_roundtrip() {
    const std::string key = "x3JJHMbDL1EzLkh9GBhXDw==";
    auto request = to_bytes(ws::make_client_handshake("localhost", 8765, "/", key));
    std::size_t offset = 0;
    ws::HttpHead head;
    assert_true(ws::try_parse_head(request, offset, head), "client request parses");
    auto response = to_bytes(ws::make_handshake_response(head));
    offset = 0;
    ws::HttpHead reply;
    assert_true(ws::try_parse_head(response, offset, reply), "server reply parses");
    assert_true(ws::verify_handshake_response(reply, key), "client accepts matching key");
    assert_true(!ws::verify_handshake_response(reply, "AAAAAAAAAAAAAAAAAAAAAA=="), "client rejects other key");
}

void test_masked_frames_decode() {
    for (std::size_t size : {std::size_t{5}, std::size_t{126}, std::size_t{70000}}) {
        const std::string payload(size, 'q');
        auto buffer = ws::encode_frame(ws::Opcode::kText, payload, kMask);
        std::size_t offset = 0;
        ws::Frame frame;
        assert_true(ws::try_decode_frame(buffer, offset, frame, 1 << 20), "frame decodes");
        assert_true(frame.masked && frame.fin, "mask and fin bits survive");
        assert_true(frame.payload == payload, "payload unmasked for size " + std::to_string(size));
        assert_true(buffer.empty() || offset == 0, "consumed bytes are compacted");
    }
}

void test_partial_and_fragmented_frames() {
    auto first = ws::encode_frame(ws::Opcode::kText, "{\"type\":", kMask, false);
    auto second = ws::encode_frame(ws::Opcode::kContinuation, "\"chat\"}", kMask, true);
    std::vector<std::byte> buffer(first.begin(), first.begin() + 3);
    std::size_t offset = 0;
    ws::Frame frame;
    assert_true(!ws::try_decode_frame(buffer, offset, frame, 1024), "truncated frame waits");
    buffer.insert(buffer.end(), first.begin() + 3, first.end());
    buffer.insert(buffer.end(), second.begin(), second.end());
    assert_true(ws::try_decode_frame(buffer, offset, frame, 1024), "first fragment decodes");
    assert_true(!frame.fin && frame.opcode == ws::Opcode::kText, "first fragment is an unfinished text frame");
    std::string message = frame.payload;
    assert_true(ws::try_decode_frame(buffer, offset, frame, 1024), "continuation decodes");
    assert_true(frame.fin && frame.opcode == ws::Opcode::kContinuation, "continuation finishes the message");
    message += frame.payload;
    assert_true(message == "{\"type\":\"chat\"}", "fragments reassemble");
}

void test_frame_violations() {
    auto big = ws::encode_frame(ws::Opcode::kText, std::string(2048, 'a'), kMask);
    std::size_t offset = 0;
    ws::Frame frame;
    bool too_big = false;
    try {
        ws::try_decode_frame(big, offset, frame, 1024);
    } catch (const std::length_error&) {
        too_big = true;
    }
    assert_true(too_big, "oversized frame raises length_error");

    auto reserved = ws::encode_frame(ws::Opcode::kText, "x", kMask);
    reserved[0] = static_cast<std::byte>(static_cast<unsigned char>(reserved[0]) | 0x40);
    offset = 0;
    bool rejected = false;
    try {
        ws::try_decode_frame(reserved, offset, frame, 1024);
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert_true(rejected, "reserved bits are a protocol error");

    auto fragmented_ping = ws::encode_frame(ws::Opcode::kPing, "p", kMask, false);
    offset = 0;
    rejected = false;
    try {
        ws::try_decode_frame(fragmented_ping, offset, frame, 1024);
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert_true(rejected, "fragmented control frame is a protocol error");

    auto close = ws::encode_close(ws::kCloseTooBig, "too big");
    offset = 0;
    assert_true(ws::try_decode_frame(close, offset, frame, 1024), "close frame decodes");
    assert_true(frame.opcode == ws::Opcode::kClose && !frame.masked, "server close frame is unmasked");
    assert_true(static_cast<unsigned char>(frame.payload[0]) == 0x03 &&
                    static_cast<unsigned char>(frame.payload[1]) == 0xF1,
                "close code 1009 is big-endian");
}

void test_inbound_messages() {
    auto auth = protocol::parse_inbound(R"({"type":"auth","password":"p","totp":"123456"})");
    assert_true(auth && auth->kind == protocol::InboundKind::kAuth, "auth message");
    auto untyped = protocol::parse_inbound(R"({"query":"when is the exam?"})");
    assert_true(untyped && untyped->kind == protocol::InboundKind::kChat, "missing type means chat");
    auto alias = protocol::parse_inbound(R"({"type":"query","query":"hi"})");
    assert_true(alias && alias->kind == protocol::InboundKind::kChat, "query is an alias of chat");
    auto unknown = protocol::parse_inbound(R"({"type":"upload"})");
    assert_true(unknown && unknown->kind == protocol::InboundKind::kUnknown, "unknown type kept");
    assert_true(!protocol::parse_inbound("not json"), "invalid JSON rejected");
    assert_true(!protocol::parse_inbound("[1,2]"), "non-object rejected");
    assert_true(protocol::message_type(protocol::Json{{"type", "summary"}}) == "summary", "message_type");
}

void test_link_header() {
    const std::string link =
        "<https://canvas.test/api/v1/courses?page=1>; rel=\"current\","
        "<https://canvas.test/api/v1/courses?page=2&per_page=100>; rel=\"next\","
        "<https://canvas.test/api/v1/courses?page=5>; rel=\"last\"";
    assert_true(canvas::server::HttpClient::next_link(link) == "https://canvas.test/api/v1/courses?page=2&per_page=100",
                "next link extracted");
    assert_true(canvas::server::HttpClient::next_link("<https://x/a>; rel=\"last\"").empty(), "no next link");
}

}  // namespace

int main() {
    try {
        test_accept_key();
        test_server_handshake();
        test_client_handshake_roundtrip();
        test_masked_frames_decode();
        test_partial_and_fragmented_frames();
        test_frame_violations();
        test_inbound_messages();
        test_link_header();
        std::cout << "websocket_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "websocket_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
