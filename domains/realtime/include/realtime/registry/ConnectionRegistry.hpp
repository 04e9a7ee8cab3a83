#pragma once

#include <realtime/payload/PayloadOptimizer.hpp>
#include <realtime/protocol/Envelope.hpp>

#include <mudcast/core/Clock.hpp>
#include <mudcast/core/Defaults.hpp>
#include <mudcast/transport/ITransport.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace realtime::registry
{

struct RegistryOptions
{
    std::size_t maxConnectionsPerPlayer{mudcast::core::defaults::kMaxConnectionsPerPlayer};
    std::chrono::milliseconds staleTimeout{mudcast::core::defaults::kStaleTimeoutMs};
};

/// fan-out 1회의 결과. failed > 0 이어도 부분 성공으로 본다.
struct DeliveryReport
{
    std::size_t attempted{0};
    std::size_t delivered{0};
    std::size_t failed{0};

    DeliveryReport &operator+=(const DeliveryReport &o) noexcept
    {
        attempted += o.attempted;
        delivered += o.delivered;
        failed += o.failed;
        return *this;
    }
};

/// 방 입장/퇴장 알림 (RoomSubscriptionManager 가 구독)
struct OccupancyChange
{
    std::string playerId;
    std::string roomId;
    bool entered{false};
};

/// 로컬 플레이어 -> transport handle 들 + 방 점유 현황
///
/// ===== 소유권 =====
/// - registry 가 transport 의 수명을 끝낸다. unregister/evict/write 실패 시 close() 를 호출하므로
///   밖에 남은 shared_ptr 로는 더 이상 쓸 수 없다. (Closed 반환)
///
/// ===== 잠금 =====
/// - mutex 는 handle 목록을 스냅샷할 때만 잡는다. transport 쓰기/close/listener 호출은 잠금 밖.
class ConnectionRegistry : private mudcast::util::NonCopyable
{
  public:
    using TransportPtr = std::shared_ptr<mudcast::transport::ITransport>;
    using HandleId = mudcast::transport::ITransport::Id;
    using OccupancyListener = std::function<void(const OccupancyChange &)>;

    ConnectionRegistry(const mudcast::core::IClock &clock, RegistryOptions opt, payload::PayloadOptimizer optimizer);

    /// player 에 handle 추가. 상한을 넘으면 가장 오래된 handle 을 닫고 밀어낸다.
    /// @return null/이미 닫힌 transport 면 false
    bool registerConnection(const std::string &playerId, TransportPtr transport);

    /// handle 제거 + close. 마지막 handle 이면 플레이어도 제거(방 퇴장 알림)
    bool unregisterConnection(const std::string &playerId, HandleId handleId);

    /// player 의 모든 live handle 로 송신
    /// @return 성공한 handle 수
    /// @throws payload::PayloadTooLarge
    std::size_t sendLocal(const std::string &playerId, const protocol::Envelope &env);

    /// 접속 중인 모든 플레이어(exclude 제외)에게 송신
    DeliveryReport broadcastLocal(const protocol::Envelope &env, const std::optional<std::string> &excludePlayerId = std::nullopt);

    /// 지정한 플레이어들에게 송신 (payload 직렬화/최적화는 1회)
    DeliveryReport deliverTo(const std::vector<std::string> &playerIds, const protocol::Envelope &env);

    /// 이미 직렬화된 프레임을 송신 (inbound 응답 등)
    std::size_t sendRaw(const std::string &playerId, std::string_view eventType, std::string_view text);

    // ----- 방 점유 -----
    /// 빈 roomId 는 퇴장. 등록되지 않은 player 면 false
    bool setPlayerRoom(const std::string &playerId, const std::string &roomId);
    [[nodiscard]] std::optional<std::string> playerRoom(const std::string &playerId) const;
    [[nodiscard]] std::set<std::string> roomOccupants(const std::string &roomId) const;
    [[nodiscard]] std::vector<std::string> connectedPlayers() const;

    // ----- 생존 관리 -----
    bool touch(const std::string &playerId, HandleId handleId);
    /// lastSeen 이 staleTimeout 보다 오래됐거나 이미 닫힌 handle 을 정리한다.
    std::size_t reapStale(mudcast::core::IClock::TimePoint now);

    [[nodiscard]] std::size_t connectionCount() const;
    [[nodiscard]] std::size_t playerCount() const;
    [[nodiscard]] bool hasPlayer(const std::string &playerId) const;

    void setOccupancyListener(OccupancyListener listener);

    /// 송신 직전 형태: toWireText(optimize(toClientJson(env)))
    [[nodiscard]] std::string renderForClient(const protocol::Envelope &env) const;

  private:
    struct Connection
    {
        TransportPtr transport;
        mudcast::core::IClock::TimePoint createdAt{};
        mudcast::core::IClock::TimePoint lastSeen{};
    };

    struct PlayerEntry
    {
        std::vector<Connection> connections; // 등록 순 (front 가 가장 오래됨)
        std::string roomId;
    };

    struct Target
    {
        std::string playerId;
        TransportPtr transport;
    };

    DeliveryReport writeAll(const std::vector<Target> &targets, std::string_view eventType, std::string_view text);

    /// handle 1개 제거. 닫을 transport 와 발생한 점유 변화를 out 으로 넘긴다.
    bool removeHandleLocked(const std::string &playerId, HandleId handleId, std::vector<TransportPtr> &toClose, std::vector<OccupancyChange> &events);
    void leaveRoomLocked(const std::string &playerId, PlayerEntry &entry, std::vector<OccupancyChange> &events);

    void closeAndNotify(std::vector<TransportPtr> &toClose, std::vector<OccupancyChange> &events);

    const mudcast::core::IClock &clock_;
    const RegistryOptions opt_;
    const payload::PayloadOptimizer optimizer_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PlayerEntry> players_;
    std::unordered_map<std::string, std::unordered_set<std::string>> roomIndex_;
    std::size_t connectionCount_{0};

    std::mutex listenerMutex_;
    OccupancyListener listener_;
};

} // namespace realtime::registry
