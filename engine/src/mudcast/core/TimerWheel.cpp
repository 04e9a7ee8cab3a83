#include <mudcast/core/TimerWheel.hpp>

#include <stdexcept>
#include <utility>

namespace mudcast::core
{

TimerWheel::TimerWheel(Duration resolution, std::size_t slots, TimePoint start)
    : resolution_(resolution), buckets_(slots), anchor_(start)
{
    if (resolution_ <= Duration::zero())
        throw std::invalid_argument("TimerWheel: resolution must be positive");
    if (slots == 0)
        throw std::invalid_argument("TimerWheel: slot count must be positive");
}

TimerWheel::TimerId TimerWheel::addTimer(Duration delay, Callback callback)
{
    if (!callback)
        throw std::invalid_argument("TimerWheel: empty callback");

    std::uint64_t ticks = 1;
    if (delay > resolution_)
        ticks = static_cast<std::uint64_t>((delay.count() + resolution_.count() - 1) / resolution_.count());

    const TimerId id = ++lastId_;
    const std::uint64_t due = now_ + ticks;
    bucketFor(due).push_back(Entry{id, due});
    callbacks_.emplace(id, std::move(callback));
    return id;
}

bool TimerWheel::cancelTimer(TimerId id)
{
    // 버킷 항목은 남겨 두고, 돌아왔을 때 callbacks_ 에 없으면 버린다.
    return callbacks_.erase(id) != 0;
}

void TimerWheel::tick()
{
    ++now_;
    fireDue();
}

void TimerWheel::tick(TimePoint now)
{
    if (now <= anchor_)
        return;

    const auto steps = std::chrono::duration_cast<Duration>(now - anchor_) / resolution_;
    for (auto i = steps; i > 0; --i)
        tick();

    // 나머지는 다음 호출로 넘긴다.
    anchor_ += resolution_ * steps;
}

void TimerWheel::fireDue()
{
    // 콜백이 같은 버킷에 다시 넣을 수 있으므로 먼저 떼어낸다.
    std::vector<Entry> current;
    current.swap(bucketFor(now_));

    for (const Entry &e : current)
    {
        auto it = callbacks_.find(e.id);
        if (it == callbacks_.end())
            continue;

        if (e.due > now_)
        {
            // 한 바퀴 이상 남은 타이머
            bucketFor(e.due).push_back(e);
            continue;
        }

        Callback cb = std::move(it->second);
        callbacks_.erase(it);
        cb();
    }
}

} // namespace mudcast::core
