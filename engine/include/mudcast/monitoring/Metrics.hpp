#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace mudcast::monitoring
{

struct DeliveryMetricsSnapshot
{
    std::uint64_t currentConnections = 0;
    std::uint64_t broadcastsTotal = 0;
    std::uint64_t routingSkippedTotal = 0;
    std::uint64_t localDeliveriesTotal = 0;
    std::uint64_t deliveryFailuresTotal = 0;

    std::uint64_t busPublishedTotal = 0;
    std::uint64_t busRetriesTotal = 0;
    std::uint64_t busDeadLetteredTotal = 0;
    std::uint64_t busEnqueueRejectedTotal = 0;
    std::uint64_t busReceivedTotal = 0;
    std::uint64_t busInboundDroppedTotal = 0;
    std::uint64_t busBreakerOpenedTotal = 0;

    std::uint64_t payloadCompressedTotal = 0;
    std::uint64_t payloadTooLargeTotal = 0;

    std::uint64_t inboundMessagesTotal = 0;
    std::uint64_t inboundErrorsTotal = 0;
};

class DeliveryMetrics
{
  public:
    DeliveryMetrics() = default;
    DeliveryMetrics(const DeliveryMetrics &) = delete;
    DeliveryMetrics &operator=(const DeliveryMetrics &) = delete;

    void reset() noexcept;

    void onConnectionOpened() noexcept { currentConnections_.fetch_add(1, std::memory_order_relaxed); }
    void onConnectionClosed() noexcept { currentConnections_.fetch_sub(1, std::memory_order_relaxed); }

    void onBroadcast() noexcept { broadcastsTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onRoutingSkipped() noexcept { routingSkippedTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onLocalDelivery(std::uint64_t n = 1) noexcept
    {
        localDeliveriesTotal_.fetch_add(n, std::memory_order_relaxed);
    }
    void onDeliveryFailure(std::uint64_t n = 1) noexcept
    {
        deliveryFailuresTotal_.fetch_add(n, std::memory_order_relaxed);
    }

    // bus
    void onBusPublished() noexcept { busPublishedTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onBusRetry() noexcept { busRetriesTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onBusDeadLettered() noexcept { busDeadLetteredTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onBusEnqueueRejected() noexcept
    {
        busEnqueueRejectedTotal_.fetch_add(1, std::memory_order_relaxed);
    }
    void onBusReceived() noexcept { busReceivedTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onBusInboundDropped() noexcept
    {
        busInboundDroppedTotal_.fetch_add(1, std::memory_order_relaxed);
    }
    void onBusBreakerOpened() noexcept
    {
        busBreakerOpenedTotal_.fetch_add(1, std::memory_order_relaxed);
    }

    // payload
    void onPayloadCompressed() noexcept
    {
        payloadCompressedTotal_.fetch_add(1, std::memory_order_relaxed);
    }
    void onPayloadTooLarge() noexcept { payloadTooLargeTotal_.fetch_add(1, std::memory_order_relaxed); }

    // inbound
    void onInboundMessage() noexcept { inboundMessagesTotal_.fetch_add(1, std::memory_order_relaxed); }
    void onInboundError() noexcept { inboundErrorsTotal_.fetch_add(1, std::memory_order_relaxed); }

    DeliveryMetricsSnapshot snapshot() const noexcept;
    std::string toPrometheusText() const;

  private:
    std::atomic<std::int64_t> currentConnections_{0};
    std::atomic<std::uint64_t> broadcastsTotal_{0};
    std::atomic<std::uint64_t> routingSkippedTotal_{0};
    std::atomic<std::uint64_t> localDeliveriesTotal_{0};
    std::atomic<std::uint64_t> deliveryFailuresTotal_{0};

    std::atomic<std::uint64_t> busPublishedTotal_{0};
    std::atomic<std::uint64_t> busRetriesTotal_{0};
    std::atomic<std::uint64_t> busDeadLetteredTotal_{0};
    std::atomic<std::uint64_t> busEnqueueRejectedTotal_{0};
    std::atomic<std::uint64_t> busReceivedTotal_{0};
    std::atomic<std::uint64_t> busInboundDroppedTotal_{0};
    std::atomic<std::uint64_t> busBreakerOpenedTotal_{0};

    std::atomic<std::uint64_t> payloadCompressedTotal_{0};
    std::atomic<std::uint64_t> payloadTooLargeTotal_{0};

    std::atomic<std::uint64_t> inboundMessagesTotal_{0};
    std::atomic<std::uint64_t> inboundErrorsTotal_{0};
};

DeliveryMetrics &deliveryMetrics() noexcept;

} // namespace mudcast::monitoring
