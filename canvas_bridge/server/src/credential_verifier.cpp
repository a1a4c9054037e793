#include "credential_verifier.hpp"

#include "encoding.hpp"
#include "password_hasher.hpp"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace canvas::server {

namespace {

std::array<unsigned char, SHA256_DIGEST_LENGTH> digest_of(std::string_view value) {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256(reinterpret_cast<const unsigned char*>(value.data()), value.size(), digest.data());
    return digest;
}

bool all_digits(std::string_view value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

// Hashing both sides first keeps the comparison length independent.
bool constant_time_equals(std::string_view lhs, std::string_view rhs) {
    const auto a = digest_of(lhs);
    const auto b = digest_of(rhs);
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

CredentialVerifier::CredentialVerifier(CredentialConfig config) : config_(std::move(config)) {
    if (config_.totp_enabled && !config_.totp_secret.empty()) {
        totp_key_ = util::base32_decode(config_.totp_secret);
        if (totp_key_.empty()) {
            throw std::invalid_argument("TOTP secret decodes to an empty key");
        }
    }
    if (config_.totp.digits == 0 || config_.totp.digits > totp::kMaxDigits) {
        throw std::invalid_argument("totp_digits must be between 1 and 9");
    }
    if (config_.totp.step_seconds == 0) {
        throw std::invalid_argument("totp_step_seconds must be positive");
    }
}

bool CredentialVerifier::configured() const {
    if (config_.password.empty()) {
        return false;
    }
    return !config_.totp_enabled || !totp_key_.empty();
}

bool CredentialVerifier::verify(std::string_view password, std::string_view totp_code,
                                std::chrono::system_clock::time_point now) const {
    if (!configured()) {
        return false;
    }
    const bool password_ok = password_matches(password);
    const bool code_ok = !config_.totp_enabled || totp_matches(totp_code, std::chrono::system_clock::to_time_t(now));
    return password_ok && code_ok;
}

bool CredentialVerifier::password_matches(std::string_view password) const {
    if (PasswordHasher::is_crypt_hash(config_.password)) {
        std::string attempted;
        try {
            attempted = PasswordHasher::hash_password(std::string(password), config_.password);
        } catch (const std::runtime_error&) {
            return false;
        }
        return constant_time_equals(attempted, config_.password);
    }
    return constant_time_equals(password, config_.password);
}

bool CredentialVerifier::totp_matches(std::string_view code, std::time_t now) const {
    if (code.size() != config_.totp.digits || !all_digits(code)) {
        return false;
    }
    const auto current = totp::time_step(now, config_.totp);
    const auto drift = static_cast<int64_t>(config_.drift_steps);
    bool matched = false;
    for (int64_t delta = -drift; delta <= drift; ++delta) {
        const int64_t step = static_cast<int64_t>(current) + delta;
        if (step < 0) {
            continue;
        }
        const auto expected = totp::hotp(totp_key_, static_cast<uint64_t>(step), config_.totp.digits);
        matched |= CRYPTO_memcmp(expected.data(), code.data(), expected.size()) == 0;
    }
    return matched;
}

}  // namespace canvas::server
