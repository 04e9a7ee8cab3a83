#pragma once

#include <atomic>
#include <chrono>

namespace mudcast::core
{

/// 주입 가능한 단조 시계.
///
/// bus 의 backoff / breaker / registry 의 stale 판정은 모두 이 인터페이스로만 시간을 읽는다.
/// 테스트는 ManualClock 으로 시간을 직접 전진시키고 sleep 하지 않는다.
class IClock
{
  public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const noexcept = 0;
};

class SteadyClock final : public IClock
{
  public:
    [[nodiscard]] TimePoint now() const noexcept override { return std::chrono::steady_clock::now(); }
};

/// 수동 전진 시계 (테스트 전용)
class ManualClock final : public IClock
{
  public:
    ManualClock() noexcept : now_(TimePoint{} + std::chrono::hours(1)) {}

    [[nodiscard]] TimePoint now() const noexcept override
    {
        return now_.load(std::memory_order_acquire);
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) noexcept
    {
        auto cur = now_.load(std::memory_order_relaxed);
        now_.store(cur + std::chrono::duration_cast<Duration>(d), std::memory_order_release);
    }

  private:
    std::atomic<TimePoint> now_;
};

} // namespace mudcast::core
