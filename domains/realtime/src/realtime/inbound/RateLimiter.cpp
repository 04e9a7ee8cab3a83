#include <realtime/inbound/RateLimiter.hpp>

#include <stdexcept>

namespace realtime::inbound
{

RateLimiter::RateLimiter(const mudcast::core::IClock &clock, std::uint32_t maxPerWindow, std::chrono::milliseconds window)
    : clock_(clock), maxPerWindow_(maxPerWindow), window_(window)
{
    if (maxPerWindow_ == 0 || window_.count() <= 0)
        throw std::invalid_argument("RateLimiter requires maxPerWindow > 0 and window > 0");
}

void RateLimiter::pruneLocked(std::deque<mudcast::core::IClock::TimePoint> &hits, mudcast::core::IClock::TimePoint now) const
{
    while (!hits.empty() && now - hits.front() >= window_)
        hits.pop_front();
}

bool RateLimiter::allow(Key key)
{
    const auto now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto &hits = hits_[key];
    pruneLocked(hits, now);
    if (hits.size() >= maxPerWindow_)
        return false;
    hits.push_back(now);
    return true;
}

std::chrono::milliseconds RateLimiter::retryAfter(Key key) const
{
    const auto now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hits_.find(key);
    if (it == hits_.end())
        return std::chrono::milliseconds{0};

    pruneLocked(it->second, now);
    if (it->second.size() < maxPerWindow_)
        return std::chrono::milliseconds{0};
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.front() + window_ - now);
}

void RateLimiter::forget(Key key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hits_.erase(key);
}

} // namespace realtime::inbound
