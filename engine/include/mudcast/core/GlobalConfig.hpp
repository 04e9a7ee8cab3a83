#pragma once

#include <mudcast/core/Defaults.hpp>
#include <mudcast/core/Logger.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace mudcast::core
{

// 프로세스 공통 설정 ([node])
struct NodeConfig
{
    // bus 메시지의 origin 으로 쓰인다. 비어 있으면 hostname-pid 로 채운다.
    std::string processId{};
    LogLevel logLevel{LogLevel::Info};
    std::string logFilePath{};
    std::uint32_t reapIntervalMs{5000};
};

enum class BrokerKind
{
    InProcess,
    Nats,
};

// [broker]
struct BrokerConfig
{
    BrokerKind kind{BrokerKind::InProcess};
    std::string host{defaults::kBrokerHost};
    std::uint16_t port{defaults::kBrokerPort};
    std::uint32_t connectTimeoutMs{defaults::kBrokerConnectTimeoutMs};
};

// [bus]
struct BusConfig
{
    std::uint32_t maxAttempts{defaults::kMaxAttempts};
    std::uint32_t baseDelayMs{defaults::kBaseDelayMs};
    std::uint32_t maxDelayMs{defaults::kMaxDelayMs};

    std::uint32_t breakerFailureThreshold{defaults::kBreakerFailureThreshold};
    std::uint32_t breakerOpenTimeoutMs{defaults::kBreakerOpenTimeoutMs};
    std::uint32_t breakerSuccessThreshold{defaults::kBreakerSuccessThreshold};

    std::size_t outboundCapacity{defaults::kOutboundCapacity};
    std::size_t inboundCapacity{defaults::kInboundCapacity};
    std::size_t deadLetterCapacity{defaults::kDeadLetterCapacity};
    std::string deadLetterPath{};

    std::uint32_t tickResolutionMs{defaults::kTickResolutionMs};
    std::size_t timerSlots{defaults::kTimerSlots};
};

// [payload]
struct PayloadConfig
{
    std::size_t compressionThreshold{defaults::kCompressionThreshold};
    std::size_t maxPayloadSize{defaults::kMaxPayloadSize};
    std::size_t maxCompressedSize{defaults::kMaxCompressedSize};
    std::uint32_t minReductionPercent{defaults::kMinReductionPercent};
};

// [registry]
struct RegistryConfig
{
    std::size_t maxConnectionsPerPlayer{defaults::kMaxConnectionsPerPlayer};
    std::uint32_t staleTimeoutMs{defaults::kStaleTimeoutMs};
    std::size_t sendBufferBytes{defaults::kSendBufferBytes};
};

// [inbound]
struct InboundConfig
{
    std::uint32_t maxMessagesPerWindow{defaults::kMaxMessagesPerWindow};
    std::uint32_t windowMs{defaults::kRateWindowMs};
};

// 전체 통합 설정
struct GlobalConfig
{
    NodeConfig node{};
    BrokerConfig broker{};
    BusConfig bus{};
    PayloadConfig payload{};
    RegistryConfig registry{};
    InboundConfig inbound{};
};

/// 섹션 간 교차 검증. 위반 시 std::invalid_argument
void validateGlobalConfig(const GlobalConfig &cfg);

} // namespace mudcast::core
