#pragma once

#include <mudcast/core/Clock.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string_view>

namespace mudcast::bus
{

enum class CircuitState
{
    Closed,
    Open,
    HalfOpen,
};

[[nodiscard]] std::string_view circuitStateName(CircuitState s) noexcept;

/// broker 연속 실패 시 일정 시간 시도를 차단하는 circuit breaker.
///
/// - Closed: 모든 시도 허용, 연속 실패 failureThreshold 회에 Open
/// - Open: openTimeout 동안 모두 거부, 경과 후 첫 allow 에서 HalfOpen
/// - HalfOpen: 시도 허용, 연속 성공 successThreshold 회에 Closed / 실패 1회에 다시 Open
class CircuitBreaker
{
  public:
    struct Options
    {
        std::uint32_t failureThreshold{5};
        std::chrono::milliseconds openTimeout{60000};
        std::uint32_t successThreshold{2};
    };

    CircuitBreaker(const mudcast::core::IClock &clock, Options opt) noexcept;

    /// 지금 broker 에 시도해도 되는지 (Open -> HalfOpen 전이가 여기서 일어남)
    [[nodiscard]] bool allowRequest();

    void onSuccess();

    /// @return 이번 실패로 Open 으로 전이했으면 true
    bool onFailure();

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] std::uint32_t consecutiveFailures() const;

  private:
    void openLocked();

    const mudcast::core::IClock &clock_;
    const Options opt_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::uint32_t failures_{0};
    std::uint32_t halfOpenSuccesses_{0};
    mudcast::core::IClock::TimePoint openedAt_{};
};

} // namespace mudcast::bus
