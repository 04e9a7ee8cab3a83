#pragma once

#include <realtime/inbound/IInboundHandler.hpp>

namespace realtime::inbound
{

// {command, args:[string]} -> ICommandSink
class CommandHandler final : public IInboundHandler
{
  public:
    explicit CommandHandler(ICommandSink &sink) : sink_(sink) {}
    void handle(const InboundContext &ctx, const nlohmann::json &data) override;

  private:
    ICommandSink &sink_;
};

// {message, channel?, target?} -> IChatSink (channel 기본값 "say")
class ChatHandler final : public IInboundHandler
{
  public:
    explicit ChatHandler(IChatSink &sink) : sink_(sink) {}
    void handle(const InboundContext &ctx, const nlohmann::json &data) override;

  private:
    IChatSink &sink_;
};

// ping -> pong (data 는 빈 object)
class PingHandler final : public IInboundHandler
{
  public:
    void handle(const InboundContext &ctx, const nlohmann::json &data) override;
};

} // namespace realtime::inbound
