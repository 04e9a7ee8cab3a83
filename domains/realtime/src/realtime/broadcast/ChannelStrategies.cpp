#include <realtime/broadcast/ChannelStrategies.hpp>
#include <realtime/protocol/Subjects.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <vector>

namespace realtime::broadcast
{
using mudcast::bus::EnqueueResult;

namespace
{
bool hasValue(const std::optional<std::string> &v) noexcept
{
    return v && !v->empty();
}

BroadcastOutcome fromReport(const registry::DeliveryReport &r) noexcept
{
    return BroadcastOutcome{BroadcastStatus::Delivered, r.delivered, r.failed, false};
}

bool republish(mudcast::bus::IEventPublisher &bus, std::string_view subject, const protocol::Envelope &env, const RoutingArgs &args)
{
    const auto res = bus.publish(subject, busPayload(env, args));
    if (res != EnqueueResult::Accepted)
        SLOG_WARN("Broadcast", "RepublishRejected", "subject={} event={}", subject, env.eventType);
    return res == EnqueueResult::Accepted;
}

void routingSkipped(std::string_view channel, std::string_view missing, const protocol::Envelope &env)
{
    mudcast::monitoring::deliveryMetrics().onRoutingSkipped();
    SLOG_WARN("Broadcast", "RoutingSkipped", "channel={} missing={} event={}", channel, missing, env.eventType);
}
} // namespace

std::string_view broadcastStatusName(BroadcastStatus s) noexcept
{
    switch (s)
    {
    case BroadcastStatus::Delivered:
        return "delivered";
    case BroadcastStatus::Skipped:
        return "skipped";
    case BroadcastStatus::NotImplemented:
        return "not_implemented";
    }
    return "skipped";
}

std::string busPayload(const protocol::Envelope &env, const RoutingArgs &args)
{
    protocol::Envelope copy = env;
    if (args.roomId)
        copy.roomId = args.roomId;
    if (args.partyId)
        copy.partyId = args.partyId;
    if (args.targetPlayerId)
        copy.targetPlayerId = args.targetPlayerId;
    if (args.senderId)
        copy.senderId = args.senderId;
    return protocol::toWireText(protocol::toBusJson(copy));
}

// -----------------------------------------------------------------------------
// RoomBasedStrategy
// -----------------------------------------------------------------------------
RoomBasedStrategy::RoomBasedStrategy(std::string subtype, registry::ConnectionRegistry &registry, std::shared_ptr<const registry::IMuteLookup> mutes)
    : subtype_(std::move(subtype)), registry_(registry), mutes_(std::move(mutes))
{
}

BroadcastOutcome RoomBasedStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const
{
    if (!hasValue(args.roomId))
    {
        routingSkipped(subtype_, "room_id", env);
        return BroadcastOutcome::skipped();
    }

    const auto occupants = registry_.roomOccupants(*args.roomId);

    std::vector<std::string> recipients;
    recipients.reserve(occupants.size());
    for (const auto &pid : occupants)
    {
        if (args.senderId && pid == *args.senderId)
            continue;
        if (mutes_ && args.senderId && mutes_->isMuted(pid, *args.senderId, subtype_))
            continue;
        recipients.push_back(pid);
    }

    if (recipients.empty())
        return BroadcastOutcome{BroadcastStatus::Delivered, 0, 0, false};

    return fromReport(registry_.deliverTo(recipients, env));
}

BroadcastOutcome RoomBasedStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const
{
    // room_id 가 없으면 registry/bus 어느 쪽도 건드리지 않는다.
    if (!hasValue(args.roomId))
    {
        routingSkipped(subtype_, "room_id", env);
        return BroadcastOutcome::skipped();
    }

    auto outcome = deliverLocal(env, args);
    outcome.published = republish(bus, protocol::roomSubject(*args.roomId), env, args);
    return outcome;
}

// -----------------------------------------------------------------------------
// GlobalStrategy
// -----------------------------------------------------------------------------
BroadcastOutcome GlobalStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const
{
    return fromReport(registry_.broadcastLocal(env, args.senderId));
}

BroadcastOutcome GlobalStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const
{
    auto outcome = deliverLocal(env, args);
    outcome.published = republish(bus, protocol::kGlobalSubject, env, args);
    return outcome;
}

// -----------------------------------------------------------------------------
// PartyStrategy
// -----------------------------------------------------------------------------
BroadcastOutcome PartyStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const
{
    SLOG_INFO("Broadcast", "PartyNotImplemented", "party={} event={}", args.partyId.value_or("-"), env.eventType);
    return BroadcastOutcome::notImplemented();
}

BroadcastOutcome PartyStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &) const
{
    return deliverLocal(env, args);
}

// -----------------------------------------------------------------------------
// WhisperStrategy
// -----------------------------------------------------------------------------
BroadcastOutcome WhisperStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const
{
    if (!hasValue(args.targetPlayerId))
    {
        routingSkipped("whisper", "target_player_id", env);
        return BroadcastOutcome::skipped();
    }

    if (!registry_.hasPlayer(*args.targetPlayerId))
    {
        // 다른 프로세스에 있는 대상에게는 중계하지 않는다.
        SLOG_DEBUG("Broadcast", "WhisperTargetNotLocal", "target={}", *args.targetPlayerId);
        return BroadcastOutcome{BroadcastStatus::Delivered, 0, 0, false};
    }

    return fromReport(registry_.deliverTo({*args.targetPlayerId}, env));
}

BroadcastOutcome WhisperStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &) const
{
    return deliverLocal(env, args);
}

// -----------------------------------------------------------------------------
// SystemAdminStrategy
// -----------------------------------------------------------------------------
BroadcastOutcome SystemAdminStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const
{
    SLOG_WARN("Broadcast", "SystemAudit", "channel={} sender={} event={} seq={}", name_, args.senderId.value_or("-"), env.eventType, env.sequenceNumber);
    return fromReport(registry_.broadcastLocal(env, args.senderId));
}

BroadcastOutcome SystemAdminStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const
{
    auto outcome = deliverLocal(env, args);
    outcome.published = republish(bus, protocol::kSystemSubject, env, args);
    return outcome;
}

// -----------------------------------------------------------------------------
// UnknownChannelStrategy
// -----------------------------------------------------------------------------
BroadcastOutcome UnknownChannelStrategy::deliverLocal(const protocol::Envelope &env, const RoutingArgs &) const
{
    mudcast::monitoring::deliveryMetrics().onRoutingSkipped();
    SLOG_WARN("Broadcast", "UnknownChannel", "channel={} event={}", raw_, env.eventType);
    return BroadcastOutcome::skipped();
}

BroadcastOutcome UnknownChannelStrategy::broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &) const
{
    return deliverLocal(env, args);
}

} // namespace realtime::broadcast
