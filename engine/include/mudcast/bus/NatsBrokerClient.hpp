#pragma once

#include <mudcast/bus/IBrokerClient.hpp>
#include <mudcast/bus/NatsProtocol.hpp>
#include <mudcast/net/Socket.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mudcast::bus
{

/// NATS text protocol 클라이언트 (TCP, 평문)
///
/// ===== 스레딩 =====
/// - connect/publish/subscribe 는 임의 스레드에서 호출 가능 (송신은 writeMutex_ 로 직렬화)
/// - 수신은 전용 reader 스레드("nats-rx")가 담당하며, MSG 를 받으면 handler 를 그 스레드에서 호출
/// - 연결이 끊기면 isConnected()==false 가 되고, 다음 publish 가 재접속을 시도합니다.
///   재접속에 성공하면 기존 구독을 모두 다시 SUB 합니다.
class NatsBrokerClient final : public IBrokerClient, private mudcast::util::NonCopyable
{
  public:
    struct Options
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{4222};
        std::uint32_t connectTimeoutMs{2000};
        nats::ConnectOptions connect{};
    };

    explicit NatsBrokerClient(Options opt);
    ~NatsBrokerClient() override;

    void connect() override;
    void disconnect() noexcept override;
    [[nodiscard]] bool isConnected() const noexcept override
    {
        return connected_.load(std::memory_order_acquire);
    }

    void publish(std::string_view subject, std::string_view payload) override;

    SubscriptionId subscribe(std::string_view pattern, MessageHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

  private:
    struct Sub
    {
        std::string pattern;
        std::shared_ptr<MessageHandler> handler;
    };

    void sendAllLocked(std::string_view bytes);
    void sendOrMarkDown(std::string_view bytes);
    void readerLoop();
    void stopReader() noexcept;

    const Options opt_;

    std::mutex connectMutex_; // connect/disconnect 직렬화
    std::mutex writeMutex_;   // socket 송신 직렬화
    mudcast::net::Socket socket_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> stopping_{false};
    std::thread reader_;

    mutable std::mutex subsMutex_;
    std::unordered_map<SubscriptionId, Sub> subs_;
    SubscriptionId nextSid_{1};
};

} // namespace mudcast::bus
