#include <realtime/protocol/ErrorFrames.hpp>

#include <mudcast/core/Time.hpp>

#include <string>

namespace realtime::protocol
{

std::string_view errorTypeName(ErrorType t) noexcept
{
    switch (t)
    {
    case ErrorType::InvalidCommand:
        return "INVALID_COMMAND";
    case ErrorType::InvalidFormat:
        return "INVALID_FORMAT";
    case ErrorType::RateLimitExceeded:
        return "RATE_LIMIT_EXCEEDED";
    case ErrorType::PayloadTooLarge:
        return "PAYLOAD_TOO_LARGE";
    }
    return "INVALID_COMMAND";
}

std::string_view userFriendlyMessage(ErrorType t) noexcept
{
    switch (t)
    {
    case ErrorType::InvalidCommand:
        return "Invalid command";
    case ErrorType::InvalidFormat:
        return "Invalid format provided";
    case ErrorType::RateLimitExceeded:
        return "Too many requests. Please try again later.";
    case ErrorType::PayloadTooLarge:
        return "Message too large";
    }
    return "Invalid command";
}

nlohmann::json makeErrorFrame(ErrorType type, std::string_view message, nlohmann::json details)
{
    return {
        {"event_type", "error"},
        {"timestamp", mudcast::core::nowIso8601Utc()},
        {"sequence_number", 0},
        {"data",
         {
             {"error_type", std::string(errorTypeName(type))},
             {"message", std::string(message)},
             {"user_friendly", std::string(userFriendlyMessage(type))},
             {"details", details.is_null() ? nlohmann::json::object() : std::move(details)},
         }},
    };
}

nlohmann::json makePongFrame()
{
    return {
        {"event_type", "pong"},
        {"timestamp", mudcast::core::nowIso8601Utc()},
        {"sequence_number", 0},
        {"data", nlohmann::json::object()},
    };
}

} // namespace realtime::protocol
