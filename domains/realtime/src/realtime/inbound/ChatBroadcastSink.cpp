#include <realtime/inbound/ChatBroadcastSink.hpp>

#include <mudcast/core/Logger.hpp>

namespace realtime::inbound
{

void ChatBroadcastSink::onChat(const ChatRequest &req)
{
    const auto text = broadcast::BroadcastCoordinator::formatChatMessage(req.channel, req.playerId, req.message);

    nlohmann::json data = {
        {"channel", req.channel},
        {"sender_id", req.playerId},
        {"content", req.message},
        {"message", text},
    };
    if (req.target)
        data["target_id"] = *req.target;

    broadcast::RoutingArgs routing;
    routing.senderId = req.playerId;
    routing.roomId = registry_.playerRoom(req.playerId);
    routing.targetPlayerId = req.target;

    const auto outcome = coordinator_.publish(protocol::makeEnvelope("chat_message", std::move(data), req.channel), routing);
    SLOG_DEBUG("Chat", "Sent", "player={} channel={} status={} delivered={}", req.playerId, req.channel, broadcast::broadcastStatusName(outcome.status), outcome.delivered);
}

} // namespace realtime::inbound
