#pragma once
#include <cstddef>
#include <cstdint>

namespace mudcast::core::defaults
{

// ===== Broker =====
inline constexpr const char *kBrokerHost = "127.0.0.1";
inline constexpr std::uint16_t kBrokerPort = 4222;
inline constexpr std::uint32_t kBrokerConnectTimeoutMs = 2000;

// ===== Bus retry / breaker =====
inline constexpr std::uint32_t kMaxAttempts = 3;
inline constexpr std::uint32_t kBaseDelayMs = 1000;
inline constexpr std::uint32_t kMaxDelayMs = 30000;
inline constexpr std::uint32_t kBreakerFailureThreshold = 5;
inline constexpr std::uint32_t kBreakerOpenTimeoutMs = 60000;
inline constexpr std::uint32_t kBreakerSuccessThreshold = 2;

// ===== Bus queues =====
inline constexpr std::size_t kOutboundCapacity = 4096;
inline constexpr std::size_t kInboundCapacity = 4096;
inline constexpr std::size_t kDeadLetterCapacity = 1000;

// ===== Bus timer =====
inline constexpr std::uint32_t kTickResolutionMs = 10;
inline constexpr std::size_t kTimerSlots = 1024;

// ===== Payload policy =====
inline constexpr std::size_t kCompressionThreshold = 10 * 1024;
inline constexpr std::size_t kMaxPayloadSize = 100 * 1024;
inline constexpr std::size_t kMaxCompressedSize = 50 * 1024;
inline constexpr std::uint32_t kMinReductionPercent = 10;

// ===== Connection registry =====
inline constexpr std::size_t kMaxConnectionsPerPlayer = 2;
inline constexpr std::uint32_t kStaleTimeoutMs = 90000;
inline constexpr std::size_t kSendBufferBytes = 256 * 1024;

// ===== Inbound rate limit =====
inline constexpr std::uint32_t kMaxMessagesPerWindow = 100;
inline constexpr std::uint32_t kRateWindowMs = 60000;

} // namespace mudcast::core::defaults
