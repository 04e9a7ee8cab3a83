#pragma once

#include <mudcast/core/Clock.hpp>
#include <mudcast/core/Defaults.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace realtime::inbound
{

/// 연결별 sliding window 메시지 제한
class RateLimiter
{
  public:
    using Key = std::uint64_t; // transport id

    RateLimiter(const mudcast::core::IClock &clock, std::uint32_t maxPerWindow, std::chrono::milliseconds window);

    /// 허용이면 기록하고 true. 창 안에서 이미 maxPerWindow 건이면 false (기록하지 않음)
    [[nodiscard]] bool allow(Key key);

    /// 현재 창이 비워지기까지 남은 시간 (제한 상태가 아니면 0)
    [[nodiscard]] std::chrono::milliseconds retryAfter(Key key) const;

    void forget(Key key);

    [[nodiscard]] std::uint32_t maxPerWindow() const noexcept { return maxPerWindow_; }
    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

  private:
    void pruneLocked(std::deque<mudcast::core::IClock::TimePoint> &hits, mudcast::core::IClock::TimePoint now) const;

    const mudcast::core::IClock &clock_;
    const std::uint32_t maxPerWindow_;
    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<Key, std::deque<mudcast::core::IClock::TimePoint>> hits_;
};

} // namespace realtime::inbound
