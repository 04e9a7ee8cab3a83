#include <realtime/broadcast/BroadcastCoordinator.hpp>
#include <realtime/payload/PayloadOptimizer.hpp>
#include <realtime/protocol/ChatFormatter.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/core/Time.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <stdexcept>

namespace realtime::broadcast
{

BroadcastCoordinator::BroadcastCoordinator(std::string processId, ChannelStrategyFactory &factory, mudcast::bus::IEventPublisher &bus)
    : processId_(std::move(processId)), factory_(factory), bus_(bus)
{
    if (processId_.empty())
        throw std::invalid_argument("BroadcastCoordinator requires a process id");
}

BroadcastOutcome BroadcastCoordinator::publish(protocol::Envelope env, const RoutingArgs &routing)
{
    if (routing.senderId)
        env.senderId = routing.senderId;
    if (routing.roomId)
        env.roomId = routing.roomId;
    if (routing.partyId)
        env.partyId = routing.partyId;
    if (routing.targetPlayerId)
        env.targetPlayerId = routing.targetPlayerId;
    if (env.timestamp.empty())
        env.timestamp = mudcast::core::nowIso8601Utc();

    env.sequenceNumber = sequences_.next(env.senderId.value_or(std::string{}));
    env.origin = processId_;

    const auto strategy = factory_.getStrategy(env.channel);
    const auto outcome = strategy->broadcast(env, routing, bus_);

    mudcast::monitoring::deliveryMetrics().onBroadcast();
    SLOG_DEBUG("Coordinator", "Published", "event={} channel={} seq={} status={} delivered={} failed={} bus={}", env.eventType, env.channel, env.sequenceNumber,
               broadcastStatusName(outcome.status), outcome.delivered, outcome.failed, outcome.published);
    return outcome;
}

BroadcastOutcome BroadcastCoordinator::deliverRemote(const std::string &subject, const std::string &bytes)
{
    protocol::Envelope env;
    try
    {
        env = protocol::fromBusJson(nlohmann::json::parse(bytes));
    }
    catch (const nlohmann::json::exception &e)
    {
        SLOG_WARN("Coordinator", "RemoteMalformed", "subject={} err={}", subject, e.what());
        return BroadcastOutcome::skipped();
    }
    catch (const std::invalid_argument &e)
    {
        SLOG_WARN("Coordinator", "RemoteInvalid", "subject={} err={}", subject, e.what());
        return BroadcastOutcome::skipped();
    }

    if (env.origin == processId_)
    {
        SLOG_TRACE("Coordinator", "OwnEchoDropped", "subject={} seq={}", subject, env.sequenceNumber);
        return BroadcastOutcome::skipped();
    }

    RoutingArgs routing{env.roomId, env.partyId, env.targetPlayerId, env.senderId};
    const auto strategy = factory_.getStrategy(env.channel);

    try
    {
        const auto outcome = strategy->deliverLocal(env, routing);
        SLOG_DEBUG("Coordinator", "RemoteDelivered", "subject={} origin={} channel={} delivered={} failed={}", subject, env.origin, env.channel, outcome.delivered, outcome.failed);
        return outcome;
    }
    catch (const payload::PayloadTooLarge &e)
    {
        // 원격 발신자의 결함. 여기서는 기록만 한다.
        SLOG_ERROR("Coordinator", "RemoteTooLarge", "subject={} origin={} err={}", subject, env.origin, e.what());
        return BroadcastOutcome::skipped();
    }
}

std::string BroadcastCoordinator::formatChatMessage(std::string_view channel, std::string_view senderName, std::string_view content)
{
    return protocol::formatChatMessage(channel, senderName, content);
}

} // namespace realtime::broadcast
