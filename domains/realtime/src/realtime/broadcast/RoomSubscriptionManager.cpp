#include <realtime/broadcast/RoomSubscriptionManager.hpp>
#include <realtime/protocol/Subjects.hpp>

#include <mudcast/core/Logger.hpp>

#include <string_view>

namespace realtime::broadcast
{

RoomSubscriptionManager::RoomSubscriptionManager(mudcast::bus::IEventSubscriber &bus, BroadcastCoordinator &coordinator) : bus_(bus), coordinator_(coordinator) {}

void RoomSubscriptionManager::subscribeLocked(const std::string &subject)
{
    bus_.subscribe(subject, [this](const std::string &s, const std::string &payload) { (void)coordinator_.deliverRemote(s, payload); });
}

void RoomSubscriptionManager::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_)
        return;
    started_ = true;

    for (auto reserved : {protocol::kGlobalSubject, protocol::kSystemSubject})
    {
        const std::string subject(reserved);
        if (refs_[subject]++ == 0)
            subscribeLocked(subject);
    }
    SLOG_INFO("RoomSubs", "Started", "subjects={}", refs_.size());
}

void RoomSubscriptionManager::stop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_)
        return;
    started_ = false;

    for (const auto &[subject, n] : refs_)
        bus_.unsubscribe(subject);
    SLOG_INFO("RoomSubs", "Stopped", "subjects={}", refs_.size());
    refs_.clear();
}

void RoomSubscriptionManager::onOccupancyChange(const registry::OccupancyChange &change)
{
    const auto subject = protocol::roomSubject(change.roomId);
    if (subject.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (change.entered)
    {
        if (refs_[subject]++ == 0)
        {
            subscribeLocked(subject);
            SLOG_INFO("RoomSubs", "Subscribed", "subject={} room={}", subject, change.roomId);
        }
        return;
    }

    auto it = refs_.find(subject);
    if (it == refs_.end())
    {
        SLOG_WARN("RoomSubs", "LeaveWithoutEnter", "subject={} player={}", subject, change.playerId);
        return;
    }

    if (--it->second == 0)
    {
        refs_.erase(it);
        bus_.unsubscribe(subject);
        SLOG_INFO("RoomSubs", "Unsubscribed", "subject={} room={}", subject, change.roomId);
    }
}

std::size_t RoomSubscriptionManager::refCount(const std::string &subject) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = refs_.find(subject);
    return it == refs_.end() ? 0 : it->second;
}

std::vector<std::string> RoomSubscriptionManager::activeSubjects() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(refs_.size());
    for (const auto &[subject, n] : refs_)
        out.push_back(subject);
    return out;
}

} // namespace realtime::broadcast
