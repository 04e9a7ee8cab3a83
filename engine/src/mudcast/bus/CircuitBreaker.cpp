#include <mudcast/bus/CircuitBreaker.hpp>

namespace mudcast::bus
{

std::string_view circuitStateName(CircuitState s) noexcept
{
    switch (s)
    {
    case CircuitState::Closed:
        return "closed";
    case CircuitState::Open:
        return "open";
    case CircuitState::HalfOpen:
        return "half_open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(const mudcast::core::IClock &clock, Options opt) noexcept
    : clock_(clock), opt_(opt)
{
}

bool CircuitBreaker::allowRequest()
{
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_)
    {
    case CircuitState::Closed:
    case CircuitState::HalfOpen:
        return true;
    case CircuitState::Open:
        if (clock_.now() - openedAt_ >= opt_.openTimeout)
        {
            state_ = CircuitState::HalfOpen;
            halfOpenSuccesses_ = 0;
            return true;
        }
        return false;
    }
    return false;
}

void CircuitBreaker::onSuccess()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;
    if (state_ == CircuitState::HalfOpen)
    {
        if (++halfOpenSuccesses_ >= opt_.successThreshold)
        {
            state_ = CircuitState::Closed;
            halfOpenSuccesses_ = 0;
        }
    }
}

bool CircuitBreaker::onFailure()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;

    if (state_ == CircuitState::HalfOpen)
    {
        openLocked();
        return true;
    }
    if (state_ == CircuitState::Closed && failures_ >= opt_.failureThreshold)
    {
        openLocked();
        return true;
    }
    return false;
}

void CircuitBreaker::openLocked()
{
    state_ = CircuitState::Open;
    openedAt_ = clock_.now();
    halfOpenSuccesses_ = 0;
}

CircuitState CircuitBreaker::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t CircuitBreaker::consecutiveFailures() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

} // namespace mudcast::bus
