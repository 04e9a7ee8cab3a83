#include <mudcast/bus/RetryPolicy.hpp>

namespace mudcast::bus
{

std::chrono::milliseconds RetryPolicy::delayAfter(std::uint32_t failedAttempts) const noexcept
{
    if (failedAttempts == 0)
        return std::chrono::milliseconds::zero();

    // 2^(n-1) 이 maxDelay 를 넘는 순간 더 곱하지 않는다. (overflow 방지)
    auto delay = baseDelay;
    for (std::uint32_t i = 1; i < failedAttempts; ++i)
    {
        if (delay >= maxDelay)
            break;
        delay *= 2;
    }
    return delay < maxDelay ? delay : maxDelay;
}

} // namespace mudcast::bus
