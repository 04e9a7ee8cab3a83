#pragma once

#include <mudcast/bus/IBrokerClient.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mudcast::bus
{

/// 한 프로세스 안의 loopback broker hub.
///
/// - 여러 InProcessBrokerClient(= 여러 bus)가 같은 hub 를 공유하면 "다중 프로세스"를
///   한 프로세스 안에서 재현할 수 있습니다. 단일 노드 배포에서도 그대로 씁니다.
/// - setAvailable(false)는 broker 장애를 흉내냅니다. (publish/connect 가 BrokerError)
class InProcessBroker
{
  public:
    using Handler = IBrokerClient::MessageHandler;

    void setAvailable(bool available) noexcept { available_.store(available, std::memory_order_release); }
    [[nodiscard]] bool isAvailable() const noexcept { return available_.load(std::memory_order_acquire); }

    /// 매칭되는 모든 구독자에게 동기 전달합니다. (잠금 밖에서 handler 호출)
    void route(const std::string &subject, const std::string &payload);

    std::uint64_t addSubscription(std::string pattern, Handler handler);
    void removeSubscription(std::uint64_t key);

    [[nodiscard]] std::size_t subscriptionCount() const;
    [[nodiscard]] std::uint64_t routedTotal() const noexcept
    {
        return routed_.load(std::memory_order_relaxed);
    }

  private:
    struct Sub
    {
        std::uint64_t key{0};
        std::string pattern;
        std::shared_ptr<Handler> handler;
    };

    std::atomic<bool> available_{true};
    std::atomic<std::uint64_t> routed_{0};

    mutable std::mutex mutex_;
    std::vector<Sub> subs_;
    std::uint64_t nextKey_{1};
};

/// InProcessBroker 에 붙는 IBrokerClient
class InProcessBrokerClient final : public IBrokerClient
{
  public:
    explicit InProcessBrokerClient(std::shared_ptr<InProcessBroker> hub);
    ~InProcessBrokerClient() override;

    void connect() override;
    void disconnect() noexcept override;
    [[nodiscard]] bool isConnected() const noexcept override;

    void publish(std::string_view subject, std::string_view payload) override;

    SubscriptionId subscribe(std::string_view pattern, MessageHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

  private:
    std::shared_ptr<InProcessBroker> hub_;
    std::atomic<bool> connected_{false};

    std::mutex mutex_;
    std::vector<std::uint64_t> keys_; // 이 client 가 hub 에 건 구독 키 (SubscriptionId == hub key)
};

} // namespace mudcast::bus
