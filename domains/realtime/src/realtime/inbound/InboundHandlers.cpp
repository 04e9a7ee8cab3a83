#include <realtime/inbound/InboundHandlers.hpp>
#include <realtime/protocol/Envelope.hpp>
#include <realtime/protocol/ErrorFrames.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

namespace realtime::inbound
{
using protocol::ErrorType;
using protocol::makeErrorFrame;

void reply(const InboundContext &ctx, const nlohmann::json &frame)
{
    if (!ctx.transport)
        return;

    const auto eventType = frame.value("event_type", std::string{"message"});
    const auto res = ctx.transport->sendText(eventType, protocol::toWireText(frame));
    if (res != mudcast::transport::SendResult::Queued)
        SLOG_DEBUG("Inbound", "ReplyDropped", "player={} handle={} event={}", ctx.playerId, ctx.transport->id(), eventType);
}

void CommandHandler::handle(const InboundContext &ctx, const nlohmann::json &data)
{
    auto cmdIt = data.find("command");
    if (cmdIt == data.end() || !cmdIt->is_string() || cmdIt->get_ref<const std::string &>().empty())
    {
        mudcast::monitoring::deliveryMetrics().onInboundError();
        reply(ctx, makeErrorFrame(ErrorType::InvalidCommand, "Empty command", {{"player_id", ctx.playerId}}));
        return;
    }

    std::vector<std::string> args;
    auto argsIt = data.find("args");
    if (argsIt != data.end() && !argsIt->is_null())
    {
        if (!argsIt->is_array())
        {
            mudcast::monitoring::deliveryMetrics().onInboundError();
            reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Command args must be an array of strings", {{"player_id", ctx.playerId}}));
            return;
        }
        for (const auto &a : *argsIt)
        {
            if (!a.is_string())
            {
                mudcast::monitoring::deliveryMetrics().onInboundError();
                reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Command args must be an array of strings", {{"player_id", ctx.playerId}}));
                return;
            }
            args.push_back(a.get<std::string>());
        }
    }

    const auto &command = cmdIt->get_ref<const std::string &>();
    SLOG_DEBUG("Inbound", "Command", "player={} command={} argc={}", ctx.playerId, command, args.size());
    sink_.onCommand(ctx.playerId, command, args);
}

void ChatHandler::handle(const InboundContext &ctx, const nlohmann::json &data)
{
    auto msgIt = data.find("message");
    if (msgIt == data.end() || !msgIt->is_string() || msgIt->get_ref<const std::string &>().empty())
    {
        mudcast::monitoring::deliveryMetrics().onInboundError();
        reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Chat message must be a non-empty string", {{"player_id", ctx.playerId}}));
        return;
    }

    std::string channel = "say";
    auto chIt = data.find("channel");
    if (chIt != data.end() && chIt->is_string() && !chIt->get_ref<const std::string &>().empty())
        channel = chIt->get<std::string>();

    ChatRequest req{ctx.playerId, std::move(channel), msgIt->get<std::string>(), std::nullopt};
    auto targetIt = data.find("target");
    if (targetIt != data.end() && targetIt->is_string() && !targetIt->get_ref<const std::string &>().empty())
        req.target = targetIt->get<std::string>();

    sink_.onChat(req);
}

void PingHandler::handle(const InboundContext &ctx, const nlohmann::json &)
{
    reply(ctx, protocol::makePongFrame());
}

} // namespace realtime::inbound
