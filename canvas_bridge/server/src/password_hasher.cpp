#include "password_hasher.hpp"

#include <crypt.h>
#include <openssl/rand.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace canvas::server {

namespace {
constexpr char kSaltAlphabet[] =
    "./abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::size_t kSaltLength = 16;
constexpr std::string_view kSha512Prefix = "$6$";
}  // namespace

std::string PasswordHasher::generate_salt() {
    std::array<unsigned char, kSaltLength> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::string salt(kSha512Prefix);
    for (unsigned char byte : random) {
        salt.push_back(kSaltAlphabet[byte % (sizeof(kSaltAlphabet) - 1)]);
    }
    return salt;
}

// A full "$6$salt$hash" string is accepted as salt, so verifying is
// hash_password(candidate, stored) == stored.
std::string PasswordHasher::hash_password(const std::string& password, const std::string& salt) {
    auto data = std::make_unique<crypt_data>();
    data->initialized = 0;
    const std::string salt_spec = is_crypt_hash(salt) ? salt : std::string(kSha512Prefix) + salt;
    char* hashed = crypt_r(password.c_str(), salt_spec.c_str(), data.get());
    if (hashed == nullptr || hashed[0] == '*') {
        throw std::runtime_error("crypt_r failed");
    }
    return std::string(hashed);
}

bool PasswordHasher::is_crypt_hash(std::string_view value) {
    return value.rfind(kSha512Prefix, 0) == 0;
}

}  // namespace canvas::server
