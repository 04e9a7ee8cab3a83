#pragma once

#include <realtime/broadcast/BroadcastCoordinator.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>

#include <mudcast/bus/IEventPublisher.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace realtime::broadcast
{

/// 로컬 점유 현황에 맞춰 bus 구독을 유지한다.
///
/// - sub-zone 의 첫 로컬 점유자가 들어오면 room.<zone>.<sub_zone> 구독
/// - 마지막 점유자가 나가면 해제 (subject 단위 참조 카운트)
/// - start() 는 예약 subject(global, system)를 구독한다.
/// 받은 메시지는 모두 BroadcastCoordinator::deliverRemote 로 넘긴다.
class RoomSubscriptionManager
{
  public:
    RoomSubscriptionManager(mudcast::bus::IEventSubscriber &bus, BroadcastCoordinator &coordinator);

    void start();
    void stop();

    /// registry 의 OccupancyListener 로 연결
    void onOccupancyChange(const registry::OccupancyChange &change);

    [[nodiscard]] std::size_t refCount(const std::string &subject) const;
    [[nodiscard]] std::vector<std::string> activeSubjects() const;

  private:
    void subscribeLocked(const std::string &subject);

    mudcast::bus::IEventSubscriber &bus_;
    BroadcastCoordinator &coordinator_;

    mutable std::mutex mutex_;
    std::map<std::string, std::size_t> refs_;
    bool started_{false};
};

} // namespace realtime::broadcast
