#include <mudcast/bus/DistributedEventBus.hpp>
#include <mudcast/bus/SubjectPattern.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/core/ThreadContext.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <stdexcept>
#include <utility>

namespace mudcast::bus
{
namespace
{
constexpr const char *kCircuitOpenError = "circuit open";
}

const char *deliveryStateName(DeliveryState s) noexcept
{
    switch (s)
    {
    case DeliveryState::Pending:
        return "pending";
    case DeliveryState::Retrying:
        return "retrying";
    case DeliveryState::Delivered:
        return "delivered";
    case DeliveryState::DeadLettered:
        return "dead_lettered";
    }
    return "pending";
}

DistributedEventBus::DistributedEventBus(std::shared_ptr<IBrokerClient> broker,
                                         std::shared_ptr<DeadLetterStore> deadLetters,
                                         const mudcast::core::IClock &clock, EventBusOptions opt)
    : broker_(std::move(broker)), deadLetters_(std::move(deadLetters)), clock_(clock),
      opt_(std::move(opt)), breaker_(clock, opt_.breaker),
      wheel_(opt_.tickResolution, opt_.timerSlots, clock.now()), inbound_(opt_.inboundCapacity)
{
    if (!broker_)
        throw std::invalid_argument("DistributedEventBus requires a broker client");
    if (!deadLetters_)
        throw std::invalid_argument("DistributedEventBus requires a dead-letter store");
    if (opt_.retry.maxAttempts == 0)
        throw std::invalid_argument("retry.maxAttempts must be >= 1");
    if (opt_.outboundCapacity == 0)
        throw std::invalid_argument("outboundCapacity must be > 0");
}

DistributedEventBus::~DistributedEventBus()
{
    stop();
}

void DistributedEventBus::start()
{
    if (running_.exchange(true, std::memory_order_acq_rel))
        return;

    try
    {
        broker_->connect();
    }
    catch (const BrokerError &e)
    {
        // 연결 실패로 기동을 막지 않는다. 첫 publish 가 재시도/breaker 경로를 탄다.
        SLOG_WARN("EventBus", "BrokerConnectFailed", "err={}", e.what());
    }

    std::size_t bound = 0;
    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        for (auto &[pattern, sub] : subs_)
        {
            bindBrokerLocked(pattern, sub);
            if (sub.brokerBound)
                ++bound;
        }
    }

    if (opt_.runWorker)
        worker_ = std::thread([this]() { workerLoop(); });

    SLOG_INFO("EventBus", "Started", "worker={} subs={} max_attempts={} base_delay_ms={}",
              opt_.runWorker, bound, opt_.retry.maxAttempts, opt_.retry.baseDelay.count());
}

void DistributedEventBus::stop()
{
    if (!running_.exchange(false, std::memory_order_acq_rel))
        return;

    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();

    // 남은 outbound 는 재시도 없이 dead-letter 로 보낸다.
    std::vector<Record> leftovers;
    {
        std::lock_guard<std::mutex> pumpLock(pumpMutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[subject, ids] : bySubject_)
        {
            for (auto id : ids)
            {
                auto it = records_.find(id);
                if (it != records_.end())
                    leftovers.push_back(std::move(it->second));
            }
        }
        records_.clear();
        bySubject_.clear();
        readySubjects_.clear();
    }

    for (const auto &rec : leftovers)
        deadLetter(rec, "shutdown");

    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        for (auto &[pattern, sub] : subs_)
        {
            if (!sub.brokerBound)
                continue;
            broker_->unsubscribe(sub.brokerSid);
            sub.brokerBound = false;
        }
    }

    SLOG_INFO("EventBus", "Stopped", "abandoned={} dead_letters={}", leftovers.size(),
              deadLetters_->size());
}

EnqueueResult DistributedEventBus::publish(std::string_view subject, std::string payload)
{
    auto &m = mudcast::monitoring::deliveryMetrics();

    if (!running_.load(std::memory_order_acquire))
    {
        m.onBusEnqueueRejected();
        SLOG_DEBUG("EventBus", "RejectStopped", "subject={}", subject);
        return EnqueueResult::Rejected;
    }
    if (!isValidSubject(subject))
    {
        m.onBusEnqueueRejected();
        SLOG_WARN("EventBus", "RejectInvalidSubject", "subject={}", subject);
        return EnqueueResult::Rejected;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (records_.size() >= opt_.outboundCapacity)
        {
            m.onBusEnqueueRejected();
            SLOG_WARN("EventBus", "RejectFull", "subject={} capacity={}", subject,
                      opt_.outboundCapacity);
            return EnqueueResult::Rejected;
        }

        const std::uint64_t id = nextMessageId_++;
        Record rec;
        rec.id = id;
        rec.subject = std::string(subject);
        rec.payload = std::move(payload);

        auto &queue = bySubject_[rec.subject];
        const bool wasIdle = queue.empty();
        queue.push_back(id);
        if (wasIdle)
            readySubjects_.push_back(rec.subject);
        records_.emplace(id, std::move(rec));
    }

    cv_.notify_one();
    return EnqueueResult::Accepted;
}

void DistributedEventBus::subscribe(std::string_view pattern, Callback callback)
{
    if (!isValidPattern(pattern))
        throw std::invalid_argument("invalid subject pattern: " + std::string(pattern));

    std::lock_guard<std::mutex> lock(subsMutex_);
    auto &sub = subs_[std::string(pattern)];
    sub.callbacks.push_back(std::make_shared<Callback>(std::move(callback)));
    if (!sub.brokerBound && running_.load(std::memory_order_acquire))
        bindBrokerLocked(std::string(pattern), sub);
}

void DistributedEventBus::unsubscribe(std::string_view pattern)
{
    std::lock_guard<std::mutex> lock(subsMutex_);
    auto it = subs_.find(std::string(pattern));
    if (it == subs_.end())
        return;

    if (it->second.brokerBound)
        broker_->unsubscribe(it->second.brokerSid);
    subs_.erase(it);
    SLOG_DEBUG("EventBus", "Unsubscribed", "pattern={}", pattern);
}

void DistributedEventBus::bindBrokerLocked(const std::string &pattern, LocalSubscription &sub)
{
    try
    {
        sub.brokerSid = broker_->subscribe(
            pattern, [this, pattern](const std::string &subject, const std::string &payload) {
                onBrokerMessage(pattern, subject, payload);
            });
        sub.brokerBound = true;
        SLOG_DEBUG("EventBus", "Subscribed", "pattern={} sid={}", pattern, sub.brokerSid);
    }
    catch (const BrokerError &e)
    {
        SLOG_WARN("EventBus", "SubscribeFailed", "pattern={} err={}", pattern, e.what());
    }
}

std::size_t DistributedEventBus::pump()
{
    std::lock_guard<std::mutex> pumpLock(pumpMutex_);
    wheel_.tick(clock_.now());
    std::size_t n = drainReady();
    n += drainInbound();
    return n;
}

void DistributedEventBus::setOutcomeListener(OutcomeListener listener)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

std::size_t DistributedEventBus::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t DistributedEventBus::subscriptionCount() const
{
    std::lock_guard<std::mutex> lock(subsMutex_);
    return subs_.size();
}

void DistributedEventBus::workerLoop()
{
    mudcast::core::ThreadContext::setCurrentRole("bus");

    while (running_.load(std::memory_order_acquire))
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, opt_.tickResolution, [this]() {
                return !running_.load(std::memory_order_acquire) || !readySubjects_.empty() ||
                       inbound_.size() > 0;
            });
        }
        (void)pump();
    }
}

std::size_t DistributedEventBus::drainReady()
{
    // 한 번의 pump 가 무한히 붙잡히지 않도록 시도 횟수 상한을 둔다.
    std::size_t n = 0;
    while (n < opt_.outboundCapacity)
    {
        std::string subject;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (readySubjects_.empty())
                break;
            subject = std::move(readySubjects_.front());
            readySubjects_.pop_front();
        }
        attempt(subject);
        ++n;
    }
    return n;
}

std::size_t DistributedEventBus::drainInbound()
{
    std::size_t n = 0;
    mudcast::core::BoundedTaskQueue::Task task;
    while (n < inbound_.capacity() && inbound_.tryPop(task))
    {
        task();
        ++n;
    }
    return n;
}

void DistributedEventBus::attempt(const std::string &subject)
{
    Record rec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto qit = bySubject_.find(subject);
        if (qit == bySubject_.end() || qit->second.empty())
            return;
        auto rit = records_.find(qit->second.front());
        if (rit == records_.end())
            return;
        rec = rit->second;
    }

    if (!breaker_.allowRequest())
    {
        onAttemptFailed(subject, std::move(rec), kCircuitOpenError);
        return;
    }

    try
    {
        broker_->publish(subject, rec.payload);
    }
    catch (const BrokerError &e)
    {
        if (breaker_.onFailure())
        {
            mudcast::monitoring::deliveryMetrics().onBusBreakerOpened();
            SLOG_WARN("EventBus", "CircuitOpened", "subject={} err={}", subject, e.what());
        }
        onAttemptFailed(subject, std::move(rec), e.what());
        return;
    }

    breaker_.onSuccess();
    onAttemptSucceeded(subject, std::move(rec));
}

void DistributedEventBus::onAttemptSucceeded(const std::string &subject, Record rec)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishFront(subject);
    }
    mudcast::monitoring::deliveryMetrics().onBusPublished();

    if (rec.failedAttempts > 0)
        SLOG_INFO("EventBus", "RecoveredAfterRetry", "id={} subject={} failed_attempts={}", rec.id,
                  subject, rec.failedAttempts);

    notify(DeliveryOutcome{rec.id, subject, DeliveryState::Delivered, rec.failedAttempts, {}});
}

void DistributedEventBus::onAttemptFailed(const std::string &subject, Record rec,
                                          std::string error)
{
    bool retry = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(rec.id);
        if (it == records_.end())
            return;

        Record &live = it->second;
        if (live.failedAttempts == 0)
            live.firstFailedAt = std::chrono::system_clock::now();
        ++live.failedAttempts;
        live.lastError = std::move(error);
        rec = live;

        retry = opt_.retry.shouldRetry(rec.failedAttempts);
        if (!retry)
            finishFront(subject);
    }

    if (retry)
    {
        const auto delay = opt_.retry.delayAfter(rec.failedAttempts);
        scheduleRetry(subject, delay);
        mudcast::monitoring::deliveryMetrics().onBusRetry();
        SLOG_WARN("EventBus", "PublishRetry", "id={} subject={} attempt={}/{} delay_ms={} err={}",
                  rec.id, subject, rec.failedAttempts, opt_.retry.maxAttempts, delay.count(),
                  rec.lastError);
        notify(DeliveryOutcome{rec.id, subject, DeliveryState::Retrying, rec.failedAttempts,
                               rec.lastError});
        return;
    }

    deadLetter(rec, "retries_exhausted");
}

void DistributedEventBus::scheduleRetry(const std::string &subject, std::chrono::milliseconds delay)
{
    // wheel 은 pump 스레드 전용. 여기는 항상 pump() 안에서 호출된다.
    (void)wheel_.addTimer(delay, [this, subject]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            readySubjects_.push_back(subject);
        }
        cv_.notify_one();
    });
}

void DistributedEventBus::finishFront(const std::string &subject)
{
    auto qit = bySubject_.find(subject);
    if (qit == bySubject_.end())
        return;

    auto &queue = qit->second;
    if (!queue.empty())
    {
        records_.erase(queue.front());
        queue.pop_front();
    }

    if (queue.empty())
        bySubject_.erase(qit);
    else
        readySubjects_.push_back(subject);
}

void DistributedEventBus::deadLetter(const Record &rec, std::string reason)
{
    DeadLetterEntry entry;
    entry.messageId = rec.id;
    entry.subject = rec.subject;
    entry.payload = rec.payload;
    entry.attemptCount = rec.failedAttempts;
    entry.lastError = rec.lastError;
    entry.reason = std::move(reason);
    entry.firstFailedAt = rec.failedAttempts > 0 ? rec.firstFailedAt : std::chrono::system_clock::now();
    entry.deadLetteredAt = std::chrono::system_clock::now();

    SLOG_ERROR("EventBus", "DeadLettered", "id={} subject={} attempts={} reason={} err={}", rec.id,
               rec.subject, rec.failedAttempts, entry.reason, rec.lastError);

    deadLetters_->add(std::move(entry));
    mudcast::monitoring::deliveryMetrics().onBusDeadLettered();

    notify(DeliveryOutcome{rec.id, rec.subject, DeliveryState::DeadLettered, rec.failedAttempts,
                           rec.lastError});
}

void DistributedEventBus::onBrokerMessage(const std::string &pattern, const std::string &subject,
                                          const std::string &payload)
{
    auto &m = mudcast::monitoring::deliveryMetrics();
    m.onBusReceived();

    const auto res = inbound_.push([this, pattern, subject, payload]() {
        dispatch(pattern, subject, payload);
    });
    if (res == mudcast::core::BoundedTaskQueue::PushResult::DroppedOldest)
    {
        m.onBusInboundDropped();
        SLOG_WARN("EventBus", "InboundDropped", "subject={} capacity={} dropped_total={}", subject,
                  inbound_.capacity(), inbound_.droppedTotal());
    }
    cv_.notify_one();
}

void DistributedEventBus::dispatch(const std::string &pattern, const std::string &subject,
                                   const std::string &payload)
{
    std::vector<std::shared_ptr<Callback>> targets;
    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        auto it = subs_.find(pattern);
        if (it == subs_.end())
            return; // 이미 해제된 구독
        targets = it->second.callbacks;
    }

    for (const auto &cb : targets)
    {
        try
        {
            (*cb)(subject, payload);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventBus", "CallbackThrew", "pattern={} subject={} err={}", pattern,
                       subject, e.what());
        }
    }
}

void DistributedEventBus::notify(const DeliveryOutcome &outcome)
{
    OutcomeListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (!listener)
        return;

    try
    {
        listener(outcome);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("EventBus", "ListenerThrew", "id={} state={} err={}", outcome.messageId,
                   deliveryStateName(outcome.state), e.what());
    }
}

} // namespace mudcast::bus
