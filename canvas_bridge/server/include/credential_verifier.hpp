#pragma once

#include "totp.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace canvas::server {

struct CredentialConfig {
    // Plaintext or "$6$" crypt hash.
    std::string password;
    // Base32 seed shared with the authenticator.
    std::string totp_secret;
    bool totp_enabled = true;
    totp::TotpParams totp;
    uint32_t drift_steps = 1;
};

// Checks password + TOTP pairs. Both factors are always evaluated and the
// result is a single bool so callers cannot tell which one failed.
class CredentialVerifier {
public:
    explicit CredentialVerifier(CredentialConfig config);

    bool verify(std::string_view password, std::string_view totp_code,
                std::chrono::system_clock::time_point now) const;

    // False when no password (or no TOTP seed while TOTP is enabled) is set;
    // every verify() fails in that case.
    bool configured() const;

private:
    bool password_matches(std::string_view password) const;
    bool totp_matches(std::string_view code, std::time_t now) const;

    CredentialConfig config_;
    std::string totp_key_;
};

bool constant_time_equals(std::string_view lhs, std::string_view rhs);

}  // namespace canvas::server
