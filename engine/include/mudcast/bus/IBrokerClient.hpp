#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mudcast::bus
{

/// broker 접속/송신 실패 (일시적 장애로 취급되어 bus 가 재시도합니다)
class BrokerError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// pub/sub broker 에 대한 최소 wire 계약.
///
/// - publish/connect 는 실패 시 BrokerError 를 던집니다.
/// - MessageHandler 는 broker 쪽 스레드(NATS reader, in-process publisher)에서 호출되므로
///   빠르게 반환해야 합니다. (bus 는 여기서 큐에 넣기만 합니다)
/// - subscribe 는 연결이 끊겨 있어도 등록을 보존하고, 재접속 시 다시 구독합니다.
class IBrokerClient
{
  public:
    using SubscriptionId = std::uint64_t;
    using MessageHandler = std::function<void(const std::string &subject, const std::string &payload)>;

    virtual ~IBrokerClient() = default;

    virtual void connect() = 0;
    virtual void disconnect() noexcept = 0;
    [[nodiscard]] virtual bool isConnected() const noexcept = 0;

    virtual void publish(std::string_view subject, std::string_view payload) = 0;

    virtual SubscriptionId subscribe(std::string_view pattern, MessageHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace mudcast::bus
