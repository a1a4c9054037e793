#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace canvas::protocol {

using Json = nlohmann::json;

// Inbound message types.
inline constexpr std::string_view kAuth = "auth";
inline constexpr std::string_view kChat = "chat";
inline constexpr std::string_view kQuery = "query";
inline constexpr std::string_view kDownload = "download";
inline constexpr std::string_view kCancel = "cancel";

// Outbound message types.
inline constexpr std::string_view kStatus = "status";
inline constexpr std::string_view kError = "error";
inline constexpr std::string_view kChatResult = "chat_result";
inline constexpr std::string_view kRoster = "roster";
inline constexpr std::string_view kConfirmation = "confirmation";
inline constexpr std::string_view kProgress = "progress";
inline constexpr std::string_view kSummary = "summary";

enum class InboundKind {
    kAuth,
    kChat,
    kDownload,
    kCancel,
    kUnknown,
};

struct InboundMessage {
    InboundKind kind = InboundKind::kUnknown;
    std::string type;
    Json payload;
};

inline InboundKind kind_from_type(std::string_view type) {
    if (type == kAuth) {
        return InboundKind::kAuth;
    }
    if (type == kChat || type == kQuery) {
        return InboundKind::kChat;
    }
    if (type == kDownload) {
        return InboundKind::kDownload;
    }
    if (type == kCancel) {
        return InboundKind::kCancel;
    }
    return InboundKind::kUnknown;
}

// Returns nullopt when the text is not a JSON object. A missing or
// non-string "type" is treated as chat.
inline std::optional<InboundMessage> parse_inbound(std::string_view text) {
    Json payload = Json::parse(text.begin(), text.end(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    InboundMessage message;
    const auto type_it = payload.find("type");
    message.type = (type_it != payload.end() && type_it->is_string()) ? type_it->get<std::string>()
                                                                      : std::string(kChat);
    message.kind = kind_from_type(message.type);
    message.payload = std::move(payload);
    return message;
}

inline std::string serialize(const Json& message) {
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

inline std::string message_type(const Json& message) {
    const auto it = message.find("type");
    if (it == message.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace canvas::protocol
