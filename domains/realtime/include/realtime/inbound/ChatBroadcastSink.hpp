#pragma once

#include <realtime/broadcast/BroadcastCoordinator.hpp>
#include <realtime/inbound/IInboundHandler.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>

namespace realtime::inbound
{

/// 클라이언트 채팅을 "chat_message" envelope 로 만들어 coordinator 로 보낸다.
/// room 채널은 발신자의 현재 방, whisper 는 req.target 을 라우팅 키로 쓴다.
class ChatBroadcastSink final : public IChatSink
{
  public:
    ChatBroadcastSink(broadcast::BroadcastCoordinator &coordinator, registry::ConnectionRegistry &registry) : coordinator_(coordinator), registry_(registry) {}

    void onChat(const ChatRequest &req) override;

  private:
    broadcast::BroadcastCoordinator &coordinator_;
    registry::ConnectionRegistry &registry_;
};

} // namespace realtime::inbound
