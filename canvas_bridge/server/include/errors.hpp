#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace canvas::server {

enum class ErrorKind {
    kAuth,
    kProtocol,
    kExternalFetch,
    kExternalUpload,
    kFatal,
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kAuth:
            return "AuthError";
        case ErrorKind::kProtocol:
            return "ProtocolError";
        case ErrorKind::kExternalFetch:
            return "ExternalFetchError";
        case ErrorKind::kExternalUpload:
            return "ExternalUploadError";
        case ErrorKind::kFatal:
            return "FatalError";
    }
    return "FatalError";
}

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class AuthError : public BridgeError {
public:
    explicit AuthError(const std::string& message) : BridgeError(ErrorKind::kAuth, message) {}
};

class ProtocolError : public BridgeError {
public:
    explicit ProtocolError(const std::string& message) : BridgeError(ErrorKind::kProtocol, message) {}
};

class ExternalFetchError : public BridgeError {
public:
    explicit ExternalFetchError(const std::string& message) : BridgeError(ErrorKind::kExternalFetch, message) {}
};

class ExternalUploadError : public BridgeError {
public:
    explicit ExternalUploadError(const std::string& message) : BridgeError(ErrorKind::kExternalUpload, message) {}
};

class FatalError : public BridgeError {
public:
    explicit FatalError(const std::string& message) : BridgeError(ErrorKind::kFatal, message) {}
};

// Manifest, mapping or report storage could not be written.
class StorageError : public FatalError {
public:
    explicit StorageError(const std::string& message) : FatalError(message) {}
};

}  // namespace canvas::server
