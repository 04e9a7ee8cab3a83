#include <mudcast/bus/InProcessBroker.hpp>
#include <mudcast/bus/SubjectPattern.hpp>

#include <algorithm>
#include <stdexcept>

namespace mudcast::bus
{

void InProcessBroker::route(const std::string &subject, const std::string &payload)
{
    std::vector<std::shared_ptr<Handler>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &s : subs_)
        {
            if (subjectMatches(s.pattern, subject))
                targets.push_back(s.handler);
        }
    }

    routed_.fetch_add(1, std::memory_order_relaxed);
    for (const auto &h : targets)
        (*h)(subject, payload);
}

std::uint64_t InProcessBroker::addSubscription(std::string pattern, Handler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t key = nextKey_++;
    subs_.push_back(Sub{key, std::move(pattern), std::make_shared<Handler>(std::move(handler))});
    return key;
}

void InProcessBroker::removeSubscription(std::uint64_t key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                               [key](const Sub &s) { return s.key == key; }),
                subs_.end());
}

std::size_t InProcessBroker::subscriptionCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return subs_.size();
}

InProcessBrokerClient::InProcessBrokerClient(std::shared_ptr<InProcessBroker> hub)
    : hub_(std::move(hub))
{
    if (!hub_)
        throw std::invalid_argument("InProcessBrokerClient requires a hub");
}

InProcessBrokerClient::~InProcessBrokerClient()
{
    disconnect();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto key : keys_)
        hub_->removeSubscription(key);
    keys_.clear();
}

void InProcessBrokerClient::connect()
{
    if (!hub_->isAvailable())
        throw BrokerError("in-process broker unavailable");
    connected_.store(true, std::memory_order_release);
}

void InProcessBrokerClient::disconnect() noexcept
{
    connected_.store(false, std::memory_order_release);
}

bool InProcessBrokerClient::isConnected() const noexcept
{
    return connected_.load(std::memory_order_acquire) && hub_->isAvailable();
}

void InProcessBrokerClient::publish(std::string_view subject, std::string_view payload)
{
    if (!hub_->isAvailable())
        throw BrokerError("in-process broker unavailable");
    if (!connected_.load(std::memory_order_acquire))
        connect();
    if (!isValidSubject(subject))
        throw BrokerError("invalid subject: " + std::string(subject));

    hub_->route(std::string(subject), std::string(payload));
}

IBrokerClient::SubscriptionId InProcessBrokerClient::subscribe(std::string_view pattern,
                                                               MessageHandler handler)
{
    if (!isValidPattern(pattern))
        throw std::invalid_argument("invalid subject pattern: " + std::string(pattern));

    const auto key = hub_->addSubscription(std::string(pattern), std::move(handler));
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.push_back(key);
    return key;
}

void InProcessBrokerClient::unsubscribe(SubscriptionId id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(keys_.begin(), keys_.end(), id);
        if (it == keys_.end())
            return;
        keys_.erase(it);
    }
    hub_->removeSubscription(id);
}

} // namespace mudcast::bus
