#pragma once

#include <chrono>
#include <string>

namespace mudcast::core
{

/// "2024-05-01T12:34:56.789Z" (UTC, millisecond precision)
[[nodiscard]] std::string formatIso8601Utc(std::chrono::system_clock::time_point tp);

[[nodiscard]] inline std::string nowIso8601Utc()
{
    return formatIso8601Utc(std::chrono::system_clock::now());
}

} // namespace mudcast::core
