#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace realtime::protocol
{

enum class ErrorType
{
    InvalidCommand,
    InvalidFormat,
    RateLimitExceeded,
    PayloadTooLarge,
};

[[nodiscard]] std::string_view errorTypeName(ErrorType t) noexcept;     // "INVALID_COMMAND" ...
[[nodiscard]] std::string_view userFriendlyMessage(ErrorType t) noexcept; // 클라이언트 표시용 고정 문구

/// {event_type:"error", timestamp, sequence_number:0, data:{error_type, message, user_friendly, details}}
[[nodiscard]] nlohmann::json makeErrorFrame(ErrorType type, std::string_view message, nlohmann::json details = nlohmann::json::object());

/// ping 에 대한 응답 {event_type:"pong", timestamp, sequence_number:0, data:{}}
[[nodiscard]] nlohmann::json makePongFrame();

} // namespace realtime::protocol
