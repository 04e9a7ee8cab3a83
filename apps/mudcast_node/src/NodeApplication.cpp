#include "NodeApplication.hpp"

#include <mudcast/bus/InProcessBroker.hpp>
#include <mudcast/bus/NatsBrokerClient.hpp>
#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>
#include <mudcast/transport/EventStreamTransport.hpp>
#include <mudcast/transport/WebSocketTransport.hpp>

#include <realtime/inbound/InboundHandlers.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

#include <unistd.h>

namespace node
{
namespace
{
using namespace std::chrono_literals;

constexpr auto kIdleSleep = 5ms;

// 게임 로직은 이 노드 밖에 있다. 명령은 기록만 남긴다.
class LoggingCommandSink final : public realtime::inbound::ICommandSink
{
  public:
    void onCommand(const std::string &playerId, const std::string &command, const std::vector<std::string> &args) override
    {
        SLOG_INFO("Node", "Command", "player={} command={} argc={}", playerId, command, args.size());
    }
};

std::string resolveProcessId(const std::string &configured)
{
    if (!configured.empty())
        return configured;

    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) != 0)
        return "mudcast-" + std::to_string(::getpid());
    return std::string(host) + "-" + std::to_string(::getpid());
}

std::shared_ptr<mudcast::bus::IBrokerClient> makeBroker(const mudcast::core::BrokerConfig &cfg, const std::string &processId)
{
    if (cfg.kind == mudcast::core::BrokerKind::Nats)
    {
        mudcast::bus::NatsBrokerClient::Options opt;
        opt.host = cfg.host;
        opt.port = cfg.port;
        opt.connectTimeoutMs = cfg.connectTimeoutMs;
        opt.connect.name = processId;
        return std::make_shared<mudcast::bus::NatsBrokerClient>(std::move(opt));
    }
    return std::make_shared<mudcast::bus::InProcessBrokerClient>(std::make_shared<mudcast::bus::InProcessBroker>());
}

mudcast::bus::EventBusOptions makeBusOptions(const mudcast::core::BusConfig &b)
{
    mudcast::bus::EventBusOptions opt;
    opt.retry.maxAttempts = b.maxAttempts;
    opt.retry.baseDelay = std::chrono::milliseconds(b.baseDelayMs);
    opt.retry.maxDelay = std::chrono::milliseconds(b.maxDelayMs);
    opt.breaker.failureThreshold = b.breakerFailureThreshold;
    opt.breaker.openTimeout = std::chrono::milliseconds(b.breakerOpenTimeoutMs);
    opt.breaker.successThreshold = b.breakerSuccessThreshold;
    opt.outboundCapacity = b.outboundCapacity;
    opt.inboundCapacity = b.inboundCapacity;
    opt.tickResolution = std::chrono::milliseconds(b.tickResolutionMs);
    opt.timerSlots = b.timerSlots;
    opt.runWorker = true;
    return opt;
}
} // namespace

NodeApplication::NodeApplication(mudcast::core::GlobalConfig cfg, const mudcast::core::IClock &clock)
    : cfg_(std::move(cfg)), clock_(clock), processId_(resolveProcessId(cfg_.node.processId))
{
    broker_ = makeBroker(cfg_.broker, processId_);
    deadLetters_ = std::make_shared<mudcast::bus::DeadLetterStore>(cfg_.bus.deadLetterCapacity, cfg_.bus.deadLetterPath);
    bus_ = std::make_unique<mudcast::bus::DistributedEventBus>(broker_, deadLetters_, clock_, makeBusOptions(cfg_.bus));

    realtime::payload::PayloadPolicy policy;
    policy.compressionThreshold = cfg_.payload.compressionThreshold;
    policy.maxPayloadSize = cfg_.payload.maxPayloadSize;
    policy.maxCompressedSize = cfg_.payload.maxCompressedSize;
    policy.minReductionPercent = cfg_.payload.minReductionPercent;

    realtime::registry::RegistryOptions regOpt;
    regOpt.maxConnectionsPerPlayer = cfg_.registry.maxConnectionsPerPlayer;
    regOpt.staleTimeout = std::chrono::milliseconds(cfg_.registry.staleTimeoutMs);

    mutes_ = std::make_shared<realtime::registry::InMemoryMuteList>();
    registry_ = std::make_unique<realtime::registry::ConnectionRegistry>(clock_, regOpt, realtime::payload::PayloadOptimizer(policy));
    strategies_ = std::make_unique<realtime::broadcast::ChannelStrategyFactory>(*registry_, mutes_);
    coordinator_ = std::make_unique<realtime::broadcast::BroadcastCoordinator>(processId_, *strategies_, *bus_);
    roomSubs_ = std::make_unique<realtime::broadcast::RoomSubscriptionManager>(*bus_, *coordinator_);

    registry_->setOccupancyListener([this](const realtime::registry::OccupancyChange &ch) { roomSubs_->onOccupancyChange(ch); });

    auto limiter = std::make_shared<realtime::inbound::RateLimiter>(clock_, cfg_.inbound.maxMessagesPerWindow, std::chrono::milliseconds(cfg_.inbound.windowMs));
    inbound_ = std::make_unique<realtime::inbound::InboundMessageHandlerFactory>(std::move(limiter));

    commandSink_ = std::make_unique<LoggingCommandSink>();
    chatSink_ = std::make_unique<realtime::inbound::ChatBroadcastSink>(*coordinator_, *registry_);

    inbound_->registerHandler("command", std::make_shared<realtime::inbound::CommandHandler>(*commandSink_));
    inbound_->registerHandler("chat", std::make_shared<realtime::inbound::ChatHandler>(*chatSink_));
    inbound_->registerHandler("ping", std::make_shared<realtime::inbound::PingHandler>());

    SLOG_INFO("Node", "Configured", "process_id={} broker={} max_attempts={} per_player={}", processId_,
              cfg_.broker.kind == mudcast::core::BrokerKind::Nats ? "nats" : "inprocess", cfg_.bus.maxAttempts, cfg_.registry.maxConnectionsPerPlayer);
}

NodeApplication::~NodeApplication()
{
    stop();
}

void NodeApplication::start()
{
    if (started_)
        return;
    started_ = true;

    bus_->start();
    roomSubs_->start();
    lastPeriodic_ = clock_.now();

    SLOG_INFO("Node", "Started", "process_id={}", processId_);
}

void NodeApplication::stop()
{
    if (!started_)
        return;
    started_ = false;

    std::vector<Attached> attached;
    {
        std::lock_guard<std::mutex> lock(attachedMutex_);
        attached.swap(attached_);
    }
    for (const auto &a : attached)
        (void)registry_->unregisterConnection(a.playerId, a.transport->id());

    roomSubs_->stop();
    bus_->stop();
    broker_->disconnect();

    SLOG_INFO("Node", "Stopped", "process_id={} dead_letters={}", processId_, deadLetters_->size());
}

mudcast::transport::ITransport::Id NodeApplication::attachConnection(mudcast::net::Socket socket, const std::string &playerId, mudcast::transport::TransportKind kind)
{
    std::shared_ptr<mudcast::transport::ITransport> t;
    if (kind == mudcast::transport::TransportKind::WebSocket)
        t = std::make_shared<mudcast::transport::WebSocketTransport>(std::move(socket), cfg_.registry.sendBufferBytes);
    else
        t = std::make_shared<mudcast::transport::EventStreamTransport>(std::move(socket), cfg_.registry.sendBufferBytes);

    if (!registry_->registerConnection(playerId, t))
    {
        SLOG_WARN("Node", "AttachRejected", "player={} kind={}", playerId, mudcast::transport::transportKindName(kind));
        t->close();
        return 0;
    }

    std::lock_guard<std::mutex> lock(attachedMutex_);
    attached_.push_back(Attached{playerId, t});
    return t->id();
}

std::size_t NodeApplication::pollOnce()
{
    std::vector<Attached> snapshot;
    {
        std::lock_guard<std::mutex> lock(attachedMutex_);
        snapshot = attached_;
    }

    std::size_t handled = 0;
    std::vector<std::string> frames;
    std::vector<Attached> dead;

    for (const auto &a : snapshot)
    {
        // 큰 프레임의 꼬리는 추가 송신이 없어도 여기서 마저 나간다.
        (void)a.transport->flushPending();

        frames.clear();
        if (a.transport->readFrames(frames) > 0)
        {
            (void)registry_->touch(a.playerId, a.transport->id());
            const realtime::inbound::InboundContext ctx{a.playerId, a.transport};
            for (const auto &f : frames)
            {
                (void)inbound_->handle(ctx, f);
                ++handled;
            }
        }

        if (!a.transport->isOpen())
            dead.push_back(a);
    }

    if (!dead.empty())
    {
        for (const auto &a : dead)
        {
            (void)registry_->unregisterConnection(a.playerId, a.transport->id());
            inbound_->forgetConnection(a.transport->id());
            if (!registry_->hasPlayer(a.playerId))
                coordinator_->forgetSender(a.playerId);
        }

        std::lock_guard<std::mutex> lock(attachedMutex_);
        attached_.erase(std::remove_if(attached_.begin(), attached_.end(), [](const Attached &a) { return !a.transport->isOpen(); }), attached_.end());
    }

    return handled;
}

void NodeApplication::periodic(mudcast::core::IClock::TimePoint now)
{
    (void)registry_->reapStale(now);

    std::vector<Attached> snapshot;
    {
        std::lock_guard<std::mutex> lock(attachedMutex_);
        snapshot = attached_;
    }
    for (const auto &a : snapshot)
    {
        if (auto *es = dynamic_cast<mudcast::transport::EventStreamTransport *>(a.transport.get()))
            (void)es->sendKeepAlive();
    }

    const auto s = mudcast::monitoring::deliveryMetrics().snapshot();
    SLOG_INFO("Node", "Stats", "conns={} players={} broadcasts={} delivered={} failed={} bus_pub={} bus_retry={} dead={} inbound={}", s.currentConnections,
              registry_->playerCount(), s.broadcastsTotal, s.localDeliveriesTotal, s.deliveryFailuresTotal, s.busPublishedTotal, s.busRetriesTotal,
              s.busDeadLetteredTotal, s.inboundMessagesTotal);
}

void NodeApplication::run(const mudcast::core::SignalHandler &signals)
{
    start();

    const auto interval = std::chrono::milliseconds(cfg_.node.reapIntervalMs);
    while (!signals.stopRequested())
    {
        const auto handled = pollOnce();

        const auto now = clock_.now();
        if (now - lastPeriodic_ >= interval)
        {
            lastPeriodic_ = now;
            periodic(now);
        }

        if (handled == 0)
            std::this_thread::sleep_for(kIdleSleep);
    }

    SLOG_INFO("Node", "StopSignal", "signal={}", mudcast::core::SignalHandler::signalName(signals.lastSignal()));
    stop();
}

} // namespace node
