#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mudcast::transport::ws
{

// RFC 6455 opcode
enum class Opcode : std::uint8_t
{
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

/// 서버 -> 클라이언트 프레임 (FIN=1, 마스크 없음)
[[nodiscard]] std::string encodeServerFrame(Opcode opcode, std::string_view payload);

struct DecodedFrame
{
    Opcode opcode{Opcode::Text};
    bool fin{true};
    std::string payload;
};

enum class DecodeStatus
{
    NeedMore,
    Frame,
    ProtocolError,
};

/// 클라이언트 -> 서버 프레임 1개를 디코드합니다.
///
/// - 클라이언트 프레임은 반드시 마스킹되어 있어야 합니다. (아니면 ProtocolError)
/// - payload 길이가 maxPayload 를 넘으면 ProtocolError
/// - Frame 이면 consumed 에 소비한 바이트 수를 넣습니다.
[[nodiscard]] DecodeStatus decodeClientFrame(std::string_view buf, std::size_t maxPayload,
                                             DecodedFrame &out, std::size_t &consumed);

} // namespace mudcast::transport::ws
