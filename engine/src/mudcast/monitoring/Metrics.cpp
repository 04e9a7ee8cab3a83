#include <mudcast/monitoring/Metrics.hpp>

#include <algorithm>
#include <sstream>

namespace mudcast::monitoring
{
namespace
{
constexpr const char *kMCurrentConnections = "mudcast_current_connections";
constexpr const char *kMBroadcastsTotal = "mudcast_broadcasts_total";
constexpr const char *kMRoutingSkippedTotal = "mudcast_routing_skipped_total";
constexpr const char *kMLocalDeliveriesTotal = "mudcast_local_deliveries_total";
constexpr const char *kMDeliveryFailuresTotal = "mudcast_delivery_failures_total";

constexpr const char *kMBusPublishedTotal = "mudcast_bus_published_total";
constexpr const char *kMBusRetriesTotal = "mudcast_bus_retries_total";
constexpr const char *kMBusDeadLetteredTotal = "mudcast_bus_dead_lettered_total";
constexpr const char *kMBusEnqueueRejectedTotal = "mudcast_bus_enqueue_rejected_total";
constexpr const char *kMBusReceivedTotal = "mudcast_bus_received_total";
constexpr const char *kMBusInboundDroppedTotal = "mudcast_bus_inbound_dropped_total";
constexpr const char *kMBusBreakerOpenedTotal = "mudcast_bus_breaker_opened_total";

constexpr const char *kMPayloadCompressedTotal = "mudcast_payload_compressed_total";
constexpr const char *kMPayloadTooLargeTotal = "mudcast_payload_too_large_total";

constexpr const char *kMInboundMessagesTotal = "mudcast_inbound_messages_total";
constexpr const char *kMInboundErrorsTotal = "mudcast_inbound_errors_total";

inline std::uint64_t clampNonNegative(std::int64_t v) noexcept
{
    return static_cast<std::uint64_t>(std::max<std::int64_t>(0, v));
}

inline void appendGauge(std::ostringstream &os, const char *name, const char *help,
                        std::uint64_t value)
{
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " gauge\n";
    os << name << " " << value << "\n";
}

inline void appendCounter(std::ostringstream &os, const char *name, const char *help,
                          std::uint64_t value)
{
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " counter\n";
    os << name << " " << value << "\n";
}
} // namespace

void DeliveryMetrics::reset() noexcept
{
    currentConnections_.store(0, std::memory_order_relaxed);
    broadcastsTotal_.store(0, std::memory_order_relaxed);
    routingSkippedTotal_.store(0, std::memory_order_relaxed);
    localDeliveriesTotal_.store(0, std::memory_order_relaxed);
    deliveryFailuresTotal_.store(0, std::memory_order_relaxed);

    busPublishedTotal_.store(0, std::memory_order_relaxed);
    busRetriesTotal_.store(0, std::memory_order_relaxed);
    busDeadLetteredTotal_.store(0, std::memory_order_relaxed);
    busEnqueueRejectedTotal_.store(0, std::memory_order_relaxed);
    busReceivedTotal_.store(0, std::memory_order_relaxed);
    busInboundDroppedTotal_.store(0, std::memory_order_relaxed);
    busBreakerOpenedTotal_.store(0, std::memory_order_relaxed);

    payloadCompressedTotal_.store(0, std::memory_order_relaxed);
    payloadTooLargeTotal_.store(0, std::memory_order_relaxed);

    inboundMessagesTotal_.store(0, std::memory_order_relaxed);
    inboundErrorsTotal_.store(0, std::memory_order_relaxed);
}

DeliveryMetricsSnapshot DeliveryMetrics::snapshot() const noexcept
{
    DeliveryMetricsSnapshot s{};
    s.currentConnections = clampNonNegative(currentConnections_.load(std::memory_order_relaxed));
    s.broadcastsTotal = broadcastsTotal_.load(std::memory_order_relaxed);
    s.routingSkippedTotal = routingSkippedTotal_.load(std::memory_order_relaxed);
    s.localDeliveriesTotal = localDeliveriesTotal_.load(std::memory_order_relaxed);
    s.deliveryFailuresTotal = deliveryFailuresTotal_.load(std::memory_order_relaxed);

    s.busPublishedTotal = busPublishedTotal_.load(std::memory_order_relaxed);
    s.busRetriesTotal = busRetriesTotal_.load(std::memory_order_relaxed);
    s.busDeadLetteredTotal = busDeadLetteredTotal_.load(std::memory_order_relaxed);
    s.busEnqueueRejectedTotal = busEnqueueRejectedTotal_.load(std::memory_order_relaxed);
    s.busReceivedTotal = busReceivedTotal_.load(std::memory_order_relaxed);
    s.busInboundDroppedTotal = busInboundDroppedTotal_.load(std::memory_order_relaxed);
    s.busBreakerOpenedTotal = busBreakerOpenedTotal_.load(std::memory_order_relaxed);

    s.payloadCompressedTotal = payloadCompressedTotal_.load(std::memory_order_relaxed);
    s.payloadTooLargeTotal = payloadTooLargeTotal_.load(std::memory_order_relaxed);

    s.inboundMessagesTotal = inboundMessagesTotal_.load(std::memory_order_relaxed);
    s.inboundErrorsTotal = inboundErrorsTotal_.load(std::memory_order_relaxed);
    return s;
}

std::string DeliveryMetrics::toPrometheusText() const
{
    const DeliveryMetricsSnapshot s = snapshot();

    std::ostringstream os;
    // Delivery
    appendGauge(os, kMCurrentConnections, "Current number of registered transport handles.",
                s.currentConnections);
    appendCounter(os, kMBroadcastsTotal, "Total envelopes routed through a channel strategy.",
                  s.broadcastsTotal);
    appendCounter(os, kMRoutingSkippedTotal, "Total broadcasts skipped for missing routing fields.",
                  s.routingSkippedTotal);
    appendCounter(os, kMLocalDeliveriesTotal, "Total successful local transport writes.",
                  s.localDeliveriesTotal);
    appendCounter(os, kMDeliveryFailuresTotal, "Total failed local transport writes.",
                  s.deliveryFailuresTotal);

    // Bus
    appendCounter(os, kMBusPublishedTotal, "Total envelopes delivered to the broker.",
                  s.busPublishedTotal);
    appendCounter(os, kMBusRetriesTotal, "Total broker publish retries scheduled.",
                  s.busRetriesTotal);
    appendCounter(os, kMBusDeadLetteredTotal, "Total envelopes written to the dead-letter store.",
                  s.busDeadLetteredTotal);
    appendCounter(os, kMBusEnqueueRejectedTotal, "Total publishes rejected at enqueue.",
                  s.busEnqueueRejectedTotal);
    appendCounter(os, kMBusReceivedTotal, "Total messages received from the broker.",
                  s.busReceivedTotal);
    appendCounter(os, kMBusInboundDroppedTotal,
                  "Total subscriber callbacks dropped because the dispatch queue was full.",
                  s.busInboundDroppedTotal);
    appendCounter(os, kMBusBreakerOpenedTotal, "Total circuit breaker open transitions.",
                  s.busBreakerOpenedTotal);

    // Payload
    appendCounter(os, kMPayloadCompressedTotal, "Total payloads sent compressed.",
                  s.payloadCompressedTotal);
    appendCounter(os, kMPayloadTooLargeTotal, "Total payloads rejected for size.",
                  s.payloadTooLargeTotal);

    // Inbound
    appendCounter(os, kMInboundMessagesTotal, "Total client frames received.",
                  s.inboundMessagesTotal);
    appendCounter(os, kMInboundErrorsTotal, "Total client frames answered with an error.",
                  s.inboundErrorsTotal);

    return os.str();
}

DeliveryMetrics &deliveryMetrics() noexcept
{
    static DeliveryMetrics g;
    return g;
}

} // namespace mudcast::monitoring
