#pragma once

#include <string>
#include <string_view>

namespace canvas::server {

class PasswordHasher {
public:
    static std::string generate_salt();
    static std::string hash_password(const std::string& password, const std::string& salt);
    static bool is_crypt_hash(std::string_view value);
};

}  // namespace canvas::server
