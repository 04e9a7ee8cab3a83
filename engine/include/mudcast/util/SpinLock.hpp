#pragma once

#include <mudcast/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

namespace mudcast::util {

/// test-and-test-and-set 스핀락 (BasicLockable)
///
/// 큐 push/pop, 전역 logger 슬롯 교체처럼 수십 ns 짜리 구간 전용.
/// 잠근 채로 콜백/I/O/대기 금지.
class SpinLock : private NonCopyable {
  public:
    void lock() noexcept {
        std::uint32_t spins = 0;
        while (locked_.exchange(true, std::memory_order_acquire)) {
            // 풀릴 때까지는 읽기만 한다. (캐시 라인 핑퐁 방지)
            while (locked_.load(std::memory_order_relaxed)) {
                if ((++spins & kYieldMask) == 0)
                    std::this_thread::yield();
            }
        }
    }

    [[nodiscard]] bool try_lock() noexcept {
        return !locked_.load(std::memory_order_relaxed) && !locked_.exchange(true, std::memory_order_acquire);
    }

    void unlock() noexcept { locked_.store(false, std::memory_order_release); }

  private:
    static constexpr std::uint32_t kYieldMask = 63;

    std::atomic<bool> locked_{false};
};

using SpinLockGuard = std::lock_guard<SpinLock>;

} // namespace mudcast::util
