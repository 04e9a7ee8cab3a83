#pragma once

#include <chrono>
#include <cstdint>

namespace mudcast::bus
{

/// bounded exponential backoff
///
/// attempt n(1부터) 실패 후 대기 시간 = baseDelay * 2^(n-1), 상한 maxDelay.
/// maxAttempts 는 "총 시도 횟수" 이며, 이를 다 쓰면 dead-letter 로 간다.
struct RetryPolicy
{
    std::uint32_t maxAttempts{3};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};

    /// attempt 번째 시도가 실패한 뒤에 또 시도해도 되는지
    [[nodiscard]] bool shouldRetry(std::uint32_t failedAttempts) const noexcept
    {
        return failedAttempts < maxAttempts;
    }

    [[nodiscard]] std::chrono::milliseconds delayAfter(std::uint32_t failedAttempts) const noexcept;
};

} // namespace mudcast::bus
