#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace canvas::util {

static constexpr std::string_view kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// RFC 4648 base32 alphabet, used by authenticator apps for TOTP seeds.
static constexpr std::string_view kBase32Chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

inline std::string base64_encode(std::string_view input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    uint32_t accumulator = 0;
    int bits_collected = 0;

    for (unsigned char c : input) {
        accumulator = (accumulator << 8) | c;
        bits_collected += 8;
        while (bits_collected >= 6) {
            bits_collected -= 6;
            output.push_back(kBase64Chars[(accumulator >> bits_collected) & 0x3F]);
        }
    }

    if (bits_collected > 0) {
        accumulator <<= 6 - bits_collected;
        output.push_back(kBase64Chars[accumulator & 0x3F]);
    }

    while (output.size() % 4 != 0) {
        output.push_back('=');
    }

    return output;
}

inline std::string base32_encode(std::string_view input) {
    std::string output;
    output.reserve(((input.size() + 4) / 5) * 8);

    uint32_t accumulator = 0;
    int bits_collected = 0;
    for (unsigned char c : input) {
        accumulator = (accumulator << 8) | c;
        bits_collected += 8;
        while (bits_collected >= 5) {
            bits_collected -= 5;
            output.push_back(kBase32Chars[(accumulator >> bits_collected) & 0x1F]);
        }
    }
    if (bits_collected > 0) {
        accumulator <<= 5 - bits_collected;
        output.push_back(kBase32Chars[accumulator & 0x1F]);
    }
    while (output.size() % 8 != 0) {
        output.push_back('=');
    }
    return output;
}

// Accepts lower case, embedded spaces/dashes and missing padding, the way
// seeds are usually copied out of provisioning screens.
inline std::string base32_decode(std::string_view input) {
    std::string output;
    output.reserve((input.size() * 5) / 8);

    uint32_t accumulator = 0;
    int bits_collected = 0;
    for (char raw : input) {
        if (raw == '=') {
            break;
        }
        if (raw == ' ' || raw == '-') {
            continue;
        }
        const char ch = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        const auto pos = kBase32Chars.find(ch);
        if (pos == std::string_view::npos) {
            throw std::invalid_argument("Invalid Base32 character");
        }
        accumulator = (accumulator << 5) | static_cast<uint32_t>(pos);
        bits_collected += 5;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            output.push_back(static_cast<char>((accumulator >> bits_collected) & 0xFF));
        }
    }
    return output;
}

}  // namespace canvas::util
