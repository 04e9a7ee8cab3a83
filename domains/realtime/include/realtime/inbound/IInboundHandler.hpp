#pragma once

#include <mudcast/transport/ITransport.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace realtime::inbound
{

/// 프레임을 보낸 연결 (인증된 player_id 는 세션 계층이 채운다)
struct InboundContext
{
    std::string playerId;
    std::shared_ptr<mudcast::transport::ITransport> transport;
};

/// 보낸 연결로 JSON 프레임 1개 응답. 닫힌 연결이면 조용히 버린다.
void reply(const InboundContext &ctx, const nlohmann::json &frame);

class IInboundHandler
{
  public:
    virtual ~IInboundHandler() = default;

    /// data 는 항상 object (누락 시 {})
    virtual void handle(const InboundContext &ctx, const nlohmann::json &data) = 0;
};

// 게임 로직 쪽 협력자
class ICommandSink
{
  public:
    virtual ~ICommandSink() = default;
    virtual void onCommand(const std::string &playerId, const std::string &command, const std::vector<std::string> &args) = 0;
};

struct ChatRequest
{
    std::string playerId;
    std::string channel;
    std::string message;
    std::optional<std::string> target; // whisper 대상
};

class IChatSink
{
  public:
    virtual ~IChatSink() = default;
    virtual void onChat(const ChatRequest &req) = 0;
};

} // namespace realtime::inbound
