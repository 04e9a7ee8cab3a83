#pragma once

#include <mudcast/bus/CircuitBreaker.hpp>
#include <mudcast/bus/DeadLetterStore.hpp>
#include <mudcast/bus/IBrokerClient.hpp>
#include <mudcast/bus/IEventPublisher.hpp>
#include <mudcast/bus/RetryPolicy.hpp>
#include <mudcast/core/BoundedTaskQueue.hpp>
#include <mudcast/core/Clock.hpp>
#include <mudcast/core/TimerWheel.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mudcast::bus
{

struct EventBusOptions
{
    RetryPolicy retry{};
    CircuitBreaker::Options breaker{};

    std::size_t outboundCapacity{4096};
    std::size_t inboundCapacity{4096};

    std::chrono::milliseconds tickResolution{10};
    std::size_t timerSlots{1024};

    // false 이면 worker 스레드를 띄우지 않는다. 호출자가 pump()를 직접 돌린다. (테스트)
    bool runWorker{true};
};

/// outbound 메시지 1건의 상태 전이
enum class DeliveryState
{
    Pending,
    Retrying,
    Delivered,
    DeadLettered,
};

[[nodiscard]] const char *deliveryStateName(DeliveryState s) noexcept;

struct DeliveryOutcome
{
    std::uint64_t messageId{0};
    std::string subject;
    DeliveryState state{DeliveryState::Pending};
    std::uint32_t failedAttempts{0};
    std::string lastError;
};

/// broker 기반 pub/sub + 재시도 + circuit breaker + dead-letter
///
/// ===== 스레딩 =====
/// - publish(): 임의 스레드. mutex 로 보호되는 큐에 넣고 바로 반환
/// - broker 수신 콜백: broker 스레드. inbound BoundedTaskQueue 에 넣기만 함
/// - 전송 시도 / backoff 타이머 / 구독 콜백 실행: worker 스레드("bus") 또는 pump() 호출자
///
/// ===== 순서 =====
/// 같은 subject 의 메시지는 FIFO 로 한 번에 하나만 시도됩니다. 앞 메시지가 재시도 중이면
/// 뒤 메시지는 기다립니다. subject 간 순서는 보장하지 않습니다.
class DistributedEventBus final : public IEventPublisher,
                                  public IEventSubscriber,
                                  private mudcast::util::NonCopyable
{
  public:
    using OutcomeListener = std::function<void(const DeliveryOutcome &)>;

    DistributedEventBus(std::shared_ptr<IBrokerClient> broker,
                        std::shared_ptr<DeadLetterStore> deadLetters,
                        const mudcast::core::IClock &clock, EventBusOptions opt);
    ~DistributedEventBus() override;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] EnqueueResult publish(std::string_view subject, std::string payload) override;

    void subscribe(std::string_view pattern, Callback callback) override;
    void unsubscribe(std::string_view pattern) override;

    /// 타이머 진행 + 준비된 outbound 시도 + inbound 디스패치를 1회 수행
    /// @return 처리한 작업 수 (전송 시도 + 디스패치)
    std::size_t pump();

    void setOutcomeListener(OutcomeListener listener);

    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t subscriptionCount() const;
    [[nodiscard]] CircuitState circuitState() const { return breaker_.state(); }
    [[nodiscard]] const DeadLetterStore &deadLetters() const noexcept { return *deadLetters_; }

  private:
    struct Record
    {
        std::uint64_t id{0};
        std::string subject;
        std::string payload;
        std::uint32_t failedAttempts{0};
        std::string lastError;
        std::chrono::system_clock::time_point firstFailedAt{};
    };

    struct LocalSubscription
    {
        IBrokerClient::SubscriptionId brokerSid{0};
        bool brokerBound{false};
        std::vector<std::shared_ptr<Callback>> callbacks;
    };

    void workerLoop();
    std::size_t drainReady();
    std::size_t drainInbound();

    void attempt(const std::string &subject);
    void onAttemptSucceeded(const std::string &subject, Record rec);
    void onAttemptFailed(const std::string &subject, Record rec, std::string error);
    void scheduleRetry(const std::string &subject, std::chrono::milliseconds delay);
    void finishFront(const std::string &subject);
    void deadLetter(const Record &rec, std::string reason);

    void bindBrokerLocked(const std::string &pattern, LocalSubscription &sub);
    void onBrokerMessage(const std::string &pattern, const std::string &subject,
                         const std::string &payload);
    void dispatch(const std::string &pattern, const std::string &subject,
                  const std::string &payload);

    void notify(const DeliveryOutcome &outcome);

    std::shared_ptr<IBrokerClient> broker_;
    std::shared_ptr<DeadLetterStore> deadLetters_;
    const mudcast::core::IClock &clock_;
    const EventBusOptions opt_;

    CircuitBreaker breaker_;

    std::atomic<bool> running_{false};

    // outbound 상태 (mutex_)
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::uint64_t, Record> records_;
    std::unordered_map<std::string, std::deque<std::uint64_t>> bySubject_;
    std::deque<std::string> readySubjects_;
    std::uint64_t nextMessageId_{1};

    // worker/pump 전용
    std::mutex pumpMutex_;
    mudcast::core::TimerWheel wheel_;

    mudcast::core::BoundedTaskQueue inbound_;

    mutable std::mutex subsMutex_;
    std::map<std::string, LocalSubscription> subs_;

    std::mutex listenerMutex_;
    OutcomeListener listener_;

    std::thread worker_;
};

} // namespace mudcast::bus
