#pragma once

#include <mudcast/bus/DeadLetterStore.hpp>
#include <mudcast/bus/DistributedEventBus.hpp>
#include <mudcast/bus/IBrokerClient.hpp>
#include <mudcast/core/Clock.hpp>
#include <mudcast/core/GlobalConfig.hpp>
#include <mudcast/core/SignalHandler.hpp>
#include <mudcast/net/Socket.hpp>
#include <mudcast/transport/ITransport.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <realtime/broadcast/BroadcastCoordinator.hpp>
#include <realtime/broadcast/ChannelStrategyFactory.hpp>
#include <realtime/broadcast/RoomSubscriptionManager.hpp>
#include <realtime/inbound/ChatBroadcastSink.hpp>
#include <realtime/inbound/InboundMessageHandlerFactory.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>
#include <realtime/registry/IMuteLookup.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace node
{

/// 실시간 전달 노드 1개 (프로세스당 1개)
///
/// 구성: broker client -> DistributedEventBus -> ConnectionRegistry / StrategyFactory
///       -> BroadcastCoordinator -> RoomSubscriptionManager, Inbound dispatch
///
/// 세션 계층(HTTP 업그레이드/인증)은 이 노드 밖에 있다. 업그레이드가 끝난 소켓과
/// 인증된 player_id 를 attachConnection() 으로 넘겨받는다.
class NodeApplication final : private mudcast::util::NonCopyable
{
  public:
    NodeApplication(mudcast::core::GlobalConfig cfg, const mudcast::core::IClock &clock);
    ~NodeApplication();

    void start();
    void stop();

    /// @return 등록된 transport id (등록 실패 시 0)
    mudcast::transport::ITransport::Id attachConnection(mudcast::net::Socket socket, const std::string &playerId, mudcast::transport::TransportKind kind);

    /// 모든 연결의 남은 outbound 를 flush 하고 inbound 프레임을 수거해 디스패치한다. 닫힌 연결은 정리한다.
    /// @return 처리한 프레임 수
    std::size_t pollOnce();

    /// 신호가 올 때까지 pollOnce + 주기 작업(reap, keepalive, metrics 로그)을 돈다.
    void run(const mudcast::core::SignalHandler &signals);

    [[nodiscard]] const std::string &processId() const noexcept { return processId_; }
    [[nodiscard]] realtime::registry::ConnectionRegistry &registry() noexcept { return *registry_; }
    [[nodiscard]] realtime::broadcast::BroadcastCoordinator &coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] mudcast::bus::DistributedEventBus &bus() noexcept { return *bus_; }
    [[nodiscard]] realtime::registry::InMemoryMuteList &mutes() noexcept { return *mutes_; }

  private:
    struct Attached
    {
        std::string playerId;
        std::shared_ptr<mudcast::transport::ITransport> transport;
    };

    void periodic(mudcast::core::IClock::TimePoint now);

    const mudcast::core::GlobalConfig cfg_;
    const mudcast::core::IClock &clock_;
    const std::string processId_;

    std::shared_ptr<mudcast::bus::IBrokerClient> broker_;
    std::shared_ptr<mudcast::bus::DeadLetterStore> deadLetters_;
    std::unique_ptr<mudcast::bus::DistributedEventBus> bus_;

    std::shared_ptr<realtime::registry::InMemoryMuteList> mutes_;
    std::unique_ptr<realtime::registry::ConnectionRegistry> registry_;
    std::unique_ptr<realtime::broadcast::ChannelStrategyFactory> strategies_;
    std::unique_ptr<realtime::broadcast::BroadcastCoordinator> coordinator_;
    std::unique_ptr<realtime::broadcast::RoomSubscriptionManager> roomSubs_;

    std::unique_ptr<realtime::inbound::ICommandSink> commandSink_;
    std::unique_ptr<realtime::inbound::ChatBroadcastSink> chatSink_;
    std::unique_ptr<realtime::inbound::InboundMessageHandlerFactory> inbound_;

    std::mutex attachedMutex_;
    std::vector<Attached> attached_;

    mudcast::core::IClock::TimePoint lastPeriodic_{};
    bool started_{false};
};

} // namespace node
