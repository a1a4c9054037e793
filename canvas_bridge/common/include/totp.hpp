#pragma once

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <string_view>

namespace canvas::totp {

struct TotpParams {
    uint32_t step_seconds = 30;
    uint32_t digits = 6;
};

inline constexpr uint32_t kMaxDigits = 9;

// RFC 4226 HOTP over HMAC-SHA1.
inline std::string hotp(std::string_view key, uint64_t counter, uint32_t digits) {
    if (digits == 0 || digits > kMaxDigits) {
        throw std::invalid_argument("TOTP digits must be between 1 and 9");
    }
    std::array<unsigned char, 8> message{};
    for (int i = 7; i >= 0; --i) {
        message[static_cast<std::size_t>(i)] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), message.data(), message.size(), digest.data(),
             &len) == nullptr ||
        len < 20) {
        throw std::runtime_error("HMAC-SHA1 failed");
    }

    const unsigned offset = digest[len - 1] & 0x0F;
    const uint32_t binary = (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
                            (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                            (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                            static_cast<uint32_t>(digest[offset + 3]);

    uint32_t modulus = 1;
    for (uint32_t i = 0; i < digits; ++i) {
        modulus *= 10;
    }
    std::string code = std::to_string(binary % modulus);
    if (code.size() < digits) {
        code.insert(0, digits - code.size(), '0');
    }
    return code;
}

inline uint64_t time_step(std::time_t unix_time, const TotpParams& params) {
    if (params.step_seconds == 0) {
        throw std::invalid_argument("TOTP step must be positive");
    }
    if (unix_time < 0) {
        return 0;
    }
    return static_cast<uint64_t>(unix_time) / params.step_seconds;
}

inline std::string code_at(std::string_view key, std::time_t unix_time, const TotpParams& params = {}) {
    return hotp(key, time_step(unix_time, params), params.digits);
}

}  // namespace canvas::totp
