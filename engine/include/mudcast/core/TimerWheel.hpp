#pragma once

#include <mudcast/core/Clock.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace mudcast::core {

/// one-shot 타이머 휠 (bus 재시도 스케줄용)
///
/// 단일 스레드 전용. delay 는 tick 단위로 올림되고 최소 1 tick 이다.
/// 시각은 IClock 기준이라 ManualClock 으로 sleep 없이 돌릴 수 있다.
/// 콜백 안에서 addTimer / cancelTimer 를 불러도 된다.
class TimerWheel : private mudcast::util::NonCopyable {
  public:
    using TimePoint = IClock::TimePoint;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    // resolution <= 0 또는 slots == 0 이면 std::invalid_argument
    TimerWheel(Duration resolution, std::size_t slots, TimePoint start);

    [[nodiscard]] std::uint64_t currentTick() const noexcept { return now_; }
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return callbacks_.size(); }

    TimerId addTimer(Duration delay, Callback callback);

    /// 아직 대기 중이면 취소하고 true
    bool cancelTimer(TimerId id);

    void tick();

    /// 기준 시각부터 now 까지 지난 만큼의 tick 을 진행한다.
    void tick(TimePoint now);

  private:
    struct Entry {
        TimerId id;
        std::uint64_t due;
    };

    [[nodiscard]] std::vector<Entry> &bucketFor(std::uint64_t tick) { return buckets_[tick % buckets_.size()]; }
    void fireDue();

    const Duration resolution_;
    std::vector<std::vector<Entry>> buckets_;
    std::unordered_map<TimerId, Callback> callbacks_; // 살아있는 타이머만

    TimePoint anchor_;
    std::uint64_t now_{0};
    TimerId lastId_{0};
};

} // namespace mudcast::core
