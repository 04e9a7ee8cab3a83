#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace realtime::protocol
{

// ---------------------------------------------------------------------
// 채널 종류 (닫힌 집합 + Unknown fallback)
//   - 라우팅 id(room/party/target)는 채널이 아니라 RoutingArgs 가 운반한다.
// ---------------------------------------------------------------------
struct RoomLocal
{
    enum class Mode
    {
        Say,
        Local,
        Emote,
        Pose,
    };
    Mode mode{Mode::Say};
};

struct Global
{
};

struct Party
{
};

struct Whisper
{
};

struct SystemAdmin
{
    bool admin{false}; // false: "system", true: "admin"
};

struct Unknown
{
    std::string raw;
};

using ChannelKind = std::variant<RoomLocal, Global, Party, Whisper, SystemAdmin, Unknown>;

/// "say" -> RoomLocal{Say}, "global" -> Global, ... 그 외는 Unknown{raw}
[[nodiscard]] ChannelKind parseChannel(std::string_view name);

/// parseChannel 의 역. Unknown 은 raw 문자열을 그대로 돌려준다.
[[nodiscard]] std::string channelName(const ChannelKind &kind);

[[nodiscard]] inline bool isUnknown(const ChannelKind &kind) noexcept
{
    return std::holds_alternative<Unknown>(kind);
}

// std::visit 용 overload 헬퍼
template <class... Ts> struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace realtime::protocol
