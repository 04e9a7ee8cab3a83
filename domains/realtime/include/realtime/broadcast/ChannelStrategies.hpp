#pragma once

#include <realtime/broadcast/IChannelStrategy.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>
#include <realtime/registry/IMuteLookup.hpp>

#include <memory>
#include <string>

namespace realtime::broadcast
{

// say / local / emote / pose
//   room_id 필수. 없으면 경고 후 no-op (registry, bus 모두 건드리지 않음)
//   방 점유자 - 발신자 - 뮤트한 청취자에게 전달 후 room subject 로 1회 재발행
class RoomBasedStrategy final : public IChannelStrategy
{
  public:
    RoomBasedStrategy(std::string subtype, registry::ConnectionRegistry &registry, std::shared_ptr<const registry::IMuteLookup> mutes);

    [[nodiscard]] std::string_view channelType() const noexcept override { return subtype_; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;

  private:
    std::string subtype_;
    registry::ConnectionRegistry &registry_;
    std::shared_ptr<const registry::IMuteLookup> mutes_;
};

// 발신자를 제외한 전원 + "global" 재발행
class GlobalStrategy final : public IChannelStrategy
{
  public:
    explicit GlobalStrategy(registry::ConnectionRegistry &registry) : registry_(registry) {}

    [[nodiscard]] std::string_view channelType() const noexcept override { return "global"; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;

  private:
    registry::ConnectionRegistry &registry_;
};

// party 시스템 미구현: 로그만 남기고 NotImplemented
class PartyStrategy final : public IChannelStrategy
{
  public:
    [[nodiscard]] std::string_view channelType() const noexcept override { return "party"; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;
};

// 대상 1명에게 로컬 전달만. bus 재발행 없음 (프로세스 간 whisper 중계는 미구현)
class WhisperStrategy final : public IChannelStrategy
{
  public:
    explicit WhisperStrategy(registry::ConnectionRegistry &registry) : registry_(registry) {}

    [[nodiscard]] std::string_view channelType() const noexcept override { return "whisper"; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;

  private:
    registry::ConnectionRegistry &registry_;
};

// system / admin: Global 과 같되 warn 레벨 감사 로그 + "system" 재발행
class SystemAdminStrategy final : public IChannelStrategy
{
  public:
    SystemAdminStrategy(std::string name, registry::ConnectionRegistry &registry) : name_(std::move(name)), registry_(registry) {}

    [[nodiscard]] std::string_view channelType() const noexcept override { return name_; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;

  private:
    std::string name_;
    registry::ConnectionRegistry &registry_;
};

// 알 수 없는 채널: 경고 후 버림 (재시도하지 않음)
class UnknownChannelStrategy final : public IChannelStrategy
{
  public:
    explicit UnknownChannelStrategy(std::string raw) : raw_(std::move(raw)) {}

    [[nodiscard]] std::string_view channelType() const noexcept override { return raw_; }
    BroadcastOutcome broadcast(const protocol::Envelope &env, const RoutingArgs &args, mudcast::bus::IEventPublisher &bus) const override;
    BroadcastOutcome deliverLocal(const protocol::Envelope &env, const RoutingArgs &args) const override;

  private:
    std::string raw_;
};

/// envelope 에 라우팅 필드를 덮어쓴 bus 직렬화 문자열
[[nodiscard]] std::string busPayload(const protocol::Envelope &env, const RoutingArgs &args);

} // namespace realtime::broadcast
