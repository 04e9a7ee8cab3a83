#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace mudcast::bus
{

enum class EnqueueResult
{
    Accepted,
    Rejected, // bus 정지 상태이거나 outbound 큐가 가득 참
};

/// 도메인 계층이 bus 에 메시지를 내보낼 때 쓰는 최소 인터페이스.
///
/// publish 는 큐에 넣기만 하고 즉시 반환합니다. (블록 없음)
/// 실제 전송 결과는 metric / dead-letter / outcome listener 로 비동기 관측합니다.
class IEventPublisher
{
  public:
    virtual ~IEventPublisher() = default;

    [[nodiscard]] virtual EnqueueResult publish(std::string_view subject, std::string payload) = 0;
};

/// subject 구독 관리 (RoomSubscriptionManager 가 사용)
class IEventSubscriber
{
  public:
    using Callback = std::function<void(const std::string &subject, const std::string &payload)>;

    virtual ~IEventSubscriber() = default;

    /// 잘못된 pattern 이면 std::invalid_argument
    virtual void subscribe(std::string_view pattern, Callback callback) = 0;

    /// pattern 에 걸린 콜백을 모두 해제합니다. 없으면 no-op
    virtual void unsubscribe(std::string_view pattern) = 0;
};

} // namespace mudcast::bus
