#include "credential_verifier.hpp"
#include "encoding.hpp"
#include "password_hasher.hpp"
#include "test_support.hpp"
#include "totp.hpp"

#include <chrono>
#include <iostream>

using canvas::test::assert_true;

namespace {

const std::string kRfcKey = "12345678901234567890";

std::chrono::system_clock::time_point at(std::time_t seconds) {
    return std::chrono::system_clock::from_time_t(seconds);
}

canvas::server::CredentialConfig base_config() {
    canvas::server::CredentialConfig config;
    config.password = "correct horse";
    config.totp_secret = canvas::util::base32_encode(kRfcKey);
    return config;
}

void test_rfc6238_vectors() {
    const canvas::totp::TotpParams eight{30, 8};
    assert_true(canvas::totp::code_at(kRfcKey, 59, eight) == "94287082", "t=59 vector");
    assert_true(canvas::totp::code_at(kRfcKey, 1111111109, eight) == "07081804", "t=1111111109 vector");
    assert_true(canvas::totp::code_at(kRfcKey, 1234567890, eight) == "89005924", "t=1234567890 vector");
    assert_true(canvas::totp::code_at(kRfcKey, 2000000000, eight) == "69279037", "t=2000000000 vector");
    assert_true(canvas::totp::hotp(kRfcKey, 0, 6) == "755224", "RFC 4226 counter 0");
    assert_true(canvas::totp::hotp(kRfcKey, 9, 6) == "520489", "RFC 4226 counter 9");
}

void test_base32() {
    const auto encoded = canvas::util::base32_encode(kRfcKey);
    assert_true(encoded == "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ", "base32 encode of RFC key");
    assert_true(canvas::util::base32_decode("gezd gnbv-GY3TQOJQ GEZDGNBVGY3TQOJQ") == kRfcKey,
                "lenient base32 decode");
    assert_true(canvas::util::base32_decode("MZXW6===") == "foo", "padded base32 decode");
    bool threw = false;
    try {
        canvas::util::base32_decode("MZ1W6");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert_true(threw, "digit 1 is not base32");
}

void test_verify_accepts_drift_window() {
    const canvas::server::CredentialVerifier verifier(base_config());
    const std::time_t now = 1111111109;
    for (int delta : {-1, 0, 1}) {
        const auto code = canvas::totp::code_at(kRfcKey, now + delta * 30);
        assert_true(verifier.verify("correct horse", code, at(now)),
                    "code from step offset " + std::to_string(delta) + " should verify");
    }
    for (int delta : {-3, -2, 2, 3}) {
        const auto code = canvas::totp::code_at(kRfcKey, now + delta * 30);
        if (code == canvas::totp::code_at(kRfcKey, now) ||
            code == canvas::totp::code_at(kRfcKey, now - 30) ||
            code == canvas::totp::code_at(kRfcKey, now + 30)) {
            continue;
        }
        assert_true(!verifier.verify("correct horse", code, at(now)),
                    "code from step offset " + std::to_string(delta) + " should be rejected");
    }
}

void test_verify_rejects_bad_pairs() {
    const canvas::server::CredentialVerifier verifier(base_config());
    const std::time_t now = 1700000000;
    const auto code = canvas::totp::code_at(kRfcKey, now);
    assert_true(verifier.verify("correct horse", code, at(now)), "valid pair");
    assert_true(!verifier.verify("correct horsf", code, at(now)), "wrong password");
    assert_true(!verifier.verify("", code, at(now)), "empty password");
    assert_true(!verifier.verify("correct horse", "", at(now)), "missing code");
    assert_true(!verifier.verify("correct horse", code.substr(0, 5), at(now)), "short code");
    assert_true(!verifier.verify("correct horse", "12345a", at(now)), "non-numeric code");
    assert_true(!verifier.verify("correct horse", " " + code.substr(1), at(now)), "padded code");
}

void test_totp_disabled_and_unconfigured() {
    auto config = base_config();
    config.totp_enabled = false;
    config.totp_secret.clear();
    const canvas::server::CredentialVerifier password_only(config);
    assert_true(password_only.configured(), "password-only verifier is configured");
    assert_true(password_only.verify("correct horse", "", at(0)), "password alone suffices");
    assert_true(!password_only.verify("nope", "", at(0)), "wrong password still fails");

    config.password.clear();
    const canvas::server::CredentialVerifier empty(config);
    assert_true(!empty.configured(), "no password means unconfigured");
    assert_true(!empty.verify("", "", at(0)), "unconfigured verifier rejects everything");

    auto missing_seed = base_config();
    missing_seed.totp_secret.clear();
    const canvas::server::CredentialVerifier no_seed(missing_seed);
    assert_true(!no_seed.configured(), "TOTP enabled without seed is unconfigured");
}

void test_crypt_hashed_password() {
    const auto salt = canvas::server::PasswordHasher::generate_salt();
    assert_true(canvas::server::PasswordHasher::is_crypt_hash(salt), "salt carries the $6$ prefix");
    const auto hash = canvas::server::PasswordHasher::hash_password("s3cret", salt);
    assert_true(hash != "s3cret" && hash.rfind("$6$", 0) == 0, "hash is a SHA-512 crypt string");

    auto config = base_config();
    config.password = hash;
    config.totp_enabled = false;
    const canvas::server::CredentialVerifier verifier(config);
    assert_true(verifier.verify("s3cret", "", at(0)), "hashed password verifies");
    assert_true(!verifier.verify("s3cret!", "", at(0)), "hashed password rejects others");
}

void test_constant_time_equals() {
    assert_true(canvas::server::constant_time_equals("abc", "abc"), "equal strings");
    assert_true(!canvas::server::constant_time_equals("abc", "abd"), "different strings");
    assert_true(!canvas::server::constant_time_equals("abc", "abcd"), "different lengths");
}

void test_invalid_parameters_rejected() {
    auto config = base_config();
    config.totp.digits = 12;
    bool threw = false;
    try {
        canvas::server::CredentialVerifier verifier(config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert_true(threw, "12 digits is rejected");
}

}  // namespace

int main() {
    try {
        test_rfc6238_vectors();
        test_base32();
        test_verify_accepts_drift_window();
        test_verify_rejects_bad_pairs();
        test_totp_disabled_and_unconfigured();
        test_crypt_hashed_password();
        test_constant_time_equals();
        test_invalid_parameters_rejected();
        std::cout << "credential_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "credential_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
