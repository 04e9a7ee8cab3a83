#pragma once

#include <string>
#include <string_view>

namespace realtime::protocol
{

inline constexpr std::string_view kGlobalSubject = "global";
inline constexpr std::string_view kSystemSubject = "system";

/// room id -> bus subject
///
/// room id 는 '_' 로 구분되며 index 1 이 zone, index 2 가 sub_zone 이다.
///   "earth_arkham_campus_room_101" -> "room.arkham.campus"
/// 토큰이 3개 미만이면 room id 전체를 하나의 토큰으로 쓴다.
///   "R1" -> "room.R1"
/// subject 에 쓸 수 없는 문자('.', '*', '>', 공백)는 '-' 로 치환한다.
/// 빈 room id 는 빈 문자열을 돌려준다. (호출자가 라우팅 오류로 처리)
[[nodiscard]] std::string roomSubject(std::string_view roomId);

} // namespace realtime::protocol
