#pragma once

#include <realtime/protocol/Envelope.hpp>

#include <mudcast/bus/IEventPublisher.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace realtime::broadcast
{

struct RoutingArgs
{
    std::optional<std::string> roomId;
    std::optional<std::string> partyId;
    std::optional<std::string> targetPlayerId;
    std::optional<std::string> senderId;
};

enum class BroadcastStatus
{
    Delivered,      // 라우팅 수행 (수신자 0명/부분 실패 포함)
    Skipped,        // 라우팅 필드 누락 또는 알 수 없는 채널
    NotImplemented, // 아직 구현되지 않은 채널 (party)
};

[[nodiscard]] std::string_view broadcastStatusName(BroadcastStatus s) noexcept;

struct BroadcastOutcome
{
    BroadcastStatus status{BroadcastStatus::Skipped};
    std::size_t delivered{0};
    std::size_t failed{0};
    bool published{false}; // bus 에 enqueue 됨

    [[nodiscard]] static BroadcastOutcome skipped() noexcept { return {}; }
    [[nodiscard]] static BroadcastOutcome notImplemented() noexcept { return {BroadcastStatus::NotImplemented, 0, 0, false}; }
};

/// 채널별 라우팅 규칙. 구현은 상태가 없다. (협력자 참조만 보관)
class IChannelStrategy
{
  public:
    virtual ~IChannelStrategy() = default;

    [[nodiscard]] virtual std::string_view channelType() const noexcept = 0;

    /// 로컬 전달 + (필요하면) bus 재발행
    virtual BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const = 0;

    /// 로컬 전달만. 다른 프로세스가 bus 로 보낸 이벤트를 받을 때 쓴다.
    virtual BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const = 0;
};

} // namespace realtime::broadcast
