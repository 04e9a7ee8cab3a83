#include <mudcast/core/GlobalConfig.hpp>

#include <stdexcept>
#include <string>

namespace mudcast::core
{

void validateGlobalConfig(const GlobalConfig &cfg)
{
    if (cfg.bus.maxAttempts == 0)
        throw std::invalid_argument("bus.max_attempts must be >= 1");
    if (cfg.bus.baseDelayMs == 0)
        throw std::invalid_argument("bus.base_delay_ms must be > 0");
    if (cfg.bus.maxDelayMs < cfg.bus.baseDelayMs)
        throw std::invalid_argument("bus.max_delay_ms must be >= bus.base_delay_ms");
    if (cfg.bus.breakerFailureThreshold == 0 || cfg.bus.breakerSuccessThreshold == 0)
        throw std::invalid_argument("bus.breaker thresholds must be >= 1");
    if (cfg.bus.outboundCapacity == 0 || cfg.bus.inboundCapacity == 0)
        throw std::invalid_argument("bus queue capacities must be > 0");
    if (cfg.bus.deadLetterCapacity == 0)
        throw std::invalid_argument("bus.dead_letter_capacity must be > 0");
    if (cfg.bus.tickResolutionMs == 0 || cfg.bus.timerSlots == 0)
        throw std::invalid_argument("bus timer settings must be > 0");

    if (cfg.payload.compressionThreshold == 0)
        throw std::invalid_argument("payload.compression_threshold must be > 0");
    if (cfg.payload.maxPayloadSize < cfg.payload.compressionThreshold)
        throw std::invalid_argument("payload.max_payload_size must be >= compression_threshold");
    if (cfg.payload.maxCompressedSize == 0)
        throw std::invalid_argument("payload.max_compressed_size must be > 0");
    if (cfg.payload.minReductionPercent > 100)
        throw std::invalid_argument("payload.min_reduction_percent out of range (0..100): " +
                                    std::to_string(cfg.payload.minReductionPercent));

    if (cfg.registry.maxConnectionsPerPlayer == 0)
        throw std::invalid_argument("registry.max_connections_per_player must be >= 1");
    if (cfg.registry.sendBufferBytes == 0)
        throw std::invalid_argument("registry.send_buffer_bytes must be > 0");

    if (cfg.inbound.maxMessagesPerWindow == 0 || cfg.inbound.windowMs == 0)
        throw std::invalid_argument("inbound rate limit settings must be > 0");

    if (cfg.broker.kind == BrokerKind::Nats && (cfg.broker.host.empty() || cfg.broker.port == 0))
        throw std::invalid_argument("broker.kind=nats requires host and port");
}

} // namespace mudcast::core
