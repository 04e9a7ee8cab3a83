#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace realtime::protocol
{

/// 파이프라인을 흐르는 이벤트 1건.
///
/// publish 이후에는 수정하지 않는다. (coordinator 가 sequence/origin 을 채운 사본을 라우팅)
struct Envelope
{
    std::string eventType;
    nlohmann::json data = nlohmann::json::object();
    std::string timestamp; // ISO-8601 UTC (ms)
    std::uint64_t sequenceNumber{0};
    std::optional<std::string> senderId;
    std::string channel;

    // bus 로 실려 가는 라우팅 필드
    std::optional<std::string> roomId;
    std::optional<std::string> partyId;
    std::optional<std::string> targetPlayerId;

    // 발행한 프로세스 id. 자기 자신이 다시 받은 이벤트를 거르는 데 쓴다.
    std::string origin;
};

/// 현재 시각을 timestamp 로 채운 envelope
[[nodiscard]] Envelope makeEnvelope(std::string eventType, nlohmann::json data, std::string channel = {});

/// bus 직렬화 (라우팅 필드 + origin 포함)
[[nodiscard]] nlohmann::json toBusJson(const Envelope &env);

/// @throws std::invalid_argument event_type 누락/타입 불일치
[[nodiscard]] Envelope fromBusJson(const nlohmann::json &j);

/// 클라이언트 wire 포맷 {event_type, timestamp, sequence_number, data, player_id?}
[[nodiscard]] nlohmann::json toClientJson(const Envelope &env);

/// compact JSON 텍스트. 게임 로직이 넣은 잘못된 UTF-8 은 U+FFFD 로 바꾼다. (throw 없음)
[[nodiscard]] std::string toWireText(const nlohmann::json &j);

} // namespace realtime::protocol
