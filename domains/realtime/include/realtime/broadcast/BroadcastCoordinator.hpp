#pragma once

#include <realtime/broadcast/ChannelStrategyFactory.hpp>
#include <realtime/broadcast/IChannelStrategy.hpp>
#include <realtime/protocol/Envelope.hpp>
#include <realtime/protocol/SequenceCounter.hpp>

#include <mudcast/bus/IEventPublisher.hpp>

#include <string>
#include <string_view>

namespace realtime::broadcast
{

/// event -> channel -> strategy -> delivery
class BroadcastCoordinator
{
  public:
    BroadcastCoordinator(std::string processId, ChannelStrategyFactory &factory, mudcast::bus::IEventPublisher &bus);

    /// sender 별 sequence_number 와 origin 을 채운 뒤 채널 strategy 로 라우팅
    /// @throws payload::PayloadTooLarge
    BroadcastOutcome publish(protocol::Envelope env, const RoutingArgs &routing);

    /// bus 로 받은 이벤트를 로컬에 전달. 자기 프로세스가 보낸 것은 버린다.
    BroadcastOutcome deliverRemote(const std::string &subject, const std::string &bytes);

    /// 로컬에서 완전히 떠난 플레이어의 sequence 상태 정리
    void forgetSender(const std::string &senderId) { (void)sequences_.forget(senderId); }

    [[nodiscard]] static std::string formatChatMessage(std::string_view channel, std::string_view senderName, std::string_view content);

    [[nodiscard]] const std::string &processId() const noexcept { return processId_; }
    [[nodiscard]] const protocol::SequenceCounter &sequences() const noexcept { return sequences_; }

  private:
    const std::string processId_;
    ChannelStrategyFactory &factory_;
    mudcast::bus::IEventPublisher &bus_;
    protocol::SequenceCounter sequences_;
};

} // namespace realtime::broadcast
