#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>

#include <mudcast/util/NonCopyable.hpp>
#include <mudcast/util/SpinLock.hpp>

namespace mudcast::core
{

/// 용량 제한이 있는 MPSC 작업 큐.
///
/// - 가득 찬 상태에서 push 하면 가장 오래된 작업을 버리고 새 작업을 넣는다. (drop-oldest)
/// - producer 는 절대 블록되지 않는다.
/// - 잠금은 SpinLock 으로 push/pop 한 번 분량만 보호한다. 작업 실행은 잠금 밖에서 한다.
class BoundedTaskQueue : private mudcast::util::NonCopyable
{
  public:
    using Task = std::function<void()>;

    enum class PushResult
    {
        Accepted,
        DroppedOldest,
    };

    /// @param capacity 0이면 std::invalid_argument
    explicit BoundedTaskQueue(std::size_t capacity);

    BoundedTaskQueue(BoundedTaskQueue &&) = delete;
    BoundedTaskQueue &operator=(BoundedTaskQueue &&) = delete;

    PushResult push(Task &&task);

    bool tryPop(Task &outTask);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint64_t droppedTotal() const;

  private:
    const std::size_t capacity_;
    mutable mudcast::util::SpinLock lock_;
    std::deque<Task> queue_;
    std::uint64_t dropped_{0};
};

} // namespace mudcast::core
