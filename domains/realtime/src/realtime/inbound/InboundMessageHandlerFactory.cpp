#include <realtime/inbound/InboundMessageHandlerFactory.hpp>
#include <realtime/payload/PayloadOptimizer.hpp>
#include <realtime/protocol/ErrorFrames.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace realtime::inbound
{
using protocol::ErrorType;
using protocol::makeErrorFrame;

std::string_view InboundMessageHandlerFactory::canonicalType(std::string_view type) noexcept
{
    // 구 클라이언트 호환
    if (type == "game_command")
        return "command";
    return type;
}

void InboundMessageHandlerFactory::registerHandler(std::string type, std::shared_ptr<IInboundHandler> handler)
{
    if (type.empty() || !handler)
        throw std::invalid_argument("registerHandler requires a type and a handler");

    std::string key(canonicalType(type));
    SLOG_INFO("Inbound", "HandlerRegistered", "type={}", key);

    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[std::move(key)] = std::move(handler);
}

bool InboundMessageHandlerFactory::hasHandler(std::string_view type) const
{
    return find(type) != nullptr;
}

std::shared_ptr<IInboundHandler> InboundMessageHandlerFactory::find(std::string_view type) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(canonicalType(type));
    return it == handlers_.end() ? nullptr : it->second;
}

void InboundMessageHandlerFactory::forgetConnection(std::uint64_t connectionId)
{
    if (rateLimiter_)
        rateLimiter_->forget(connectionId);
}

HandleResult InboundMessageHandlerFactory::handle(const InboundContext &ctx, std::string_view rawFrame)
{
    auto &m = mudcast::monitoring::deliveryMetrics();
    m.onInboundMessage();

    const nlohmann::json details = {{"player_id", ctx.playerId}};

    if (rateLimiter_ && ctx.transport && !rateLimiter_->allow(ctx.transport->id()))
    {
        m.onInboundError();
        const auto wait = rateLimiter_->retryAfter(ctx.transport->id());
        SLOG_WARN("Inbound", "RateLimited", "player={} handle={} retry_after_ms={}", ctx.playerId, ctx.transport->id(), wait.count());
        reply(ctx, makeErrorFrame(ErrorType::RateLimitExceeded,
                                  fmt::format("Message rate limit exceeded. Limit: {} messages per {} seconds. Try again in {} seconds.", rateLimiter_->maxPerWindow(),
                                              rateLimiter_->window().count() / 1000, (wait.count() + 999) / 1000),
                                  details));
        return HandleResult::RateLimited;
    }

    nlohmann::json frame;
    try
    {
        frame = nlohmann::json::parse(rawFrame);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        m.onInboundError();
        SLOG_WARN("Inbound", "InvalidJson", "player={} err={}", ctx.playerId, e.what());
        reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Invalid JSON format", details));
        return HandleResult::Malformed;
    }

    if (!frame.is_object())
    {
        m.onInboundError();
        reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Message must be a JSON object", details));
        return HandleResult::Malformed;
    }

    const auto typeIt = frame.find("type");
    const std::string type = (typeIt != frame.end() && typeIt->is_string()) ? typeIt->get<std::string>() : std::string{};

    auto handler = find(type);
    if (!handler)
    {
        m.onInboundError();
        SLOG_WARN("Inbound", "UnknownType", "player={} type={}", ctx.playerId, type.empty() ? std::string_view("-") : std::string_view(type));
        reply(ctx, makeErrorFrame(ErrorType::InvalidCommand, fmt::format("Unknown message type: {}", type), details));
        return HandleResult::UnknownType;
    }

    nlohmann::json data = nlohmann::json::object();
    auto dataIt = frame.find("data");
    if (dataIt != frame.end() && !dataIt->is_null())
    {
        if (!dataIt->is_object())
        {
            m.onInboundError();
            reply(ctx, makeErrorFrame(ErrorType::InvalidFormat, "Message data must be an object", details));
            return HandleResult::Malformed;
        }
        data = std::move(*dataIt);
    }

    try
    {
        handler->handle(ctx, data);
    }
    catch (const payload::PayloadTooLarge &e)
    {
        // 발신자 자신의 행동으로 생긴 크기 위반은 발신자에게 알린다.
        m.onInboundError();
        SLOG_WARN("Inbound", "PayloadTooLarge", "player={} type={} err={}", ctx.playerId, type, e.what());
        reply(ctx, makeErrorFrame(ErrorType::PayloadTooLarge, e.what(), details));
        return HandleResult::Failed;
    }
    catch (const std::exception &e)
    {
        m.onInboundError();
        SLOG_ERROR("Inbound", "HandlerThrew", "player={} type={} err={}", ctx.playerId, type, e.what());
        return HandleResult::Failed;
    }

    return HandleResult::Dispatched;
}

} // namespace realtime::inbound
