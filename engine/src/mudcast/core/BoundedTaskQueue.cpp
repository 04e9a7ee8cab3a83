#include <mudcast/core/BoundedTaskQueue.hpp>

#include <stdexcept>

namespace mudcast::core
{

BoundedTaskQueue::BoundedTaskQueue(std::size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0)
        throw std::invalid_argument("BoundedTaskQueue capacity must be greater than 0");
}

BoundedTaskQueue::PushResult BoundedTaskQueue::push(Task &&task)
{
    // 버려진 작업의 소멸(캡처 해제)은 잠금 밖에서 일어나도록 꺼내 둔다.
    Task evicted;
    PushResult result = PushResult::Accepted;
    {
        mudcast::util::SpinLockGuard guard(lock_);
        if (queue_.size() >= capacity_)
        {
            evicted = std::move(queue_.front());
            queue_.pop_front();
            ++dropped_;
            result = PushResult::DroppedOldest;
        }
        queue_.push_back(std::move(task));
    }
    return result;
}

bool BoundedTaskQueue::tryPop(Task &outTask)
{
    mudcast::util::SpinLockGuard guard(lock_);

    if (queue_.empty())
    {
        return false;
    }

    outTask = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t BoundedTaskQueue::size() const
{
    mudcast::util::SpinLockGuard guard(lock_);
    return queue_.size();
}

std::uint64_t BoundedTaskQueue::droppedTotal() const
{
    mudcast::util::SpinLockGuard guard(lock_);
    return dropped_;
}

} // namespace mudcast::core
