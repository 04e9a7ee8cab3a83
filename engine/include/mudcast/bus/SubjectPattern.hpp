#pragma once

#include <string_view>

namespace mudcast::bus
{

/// '.' 로 구분된 토큰이 비어 있지 않고 공백/와일드카드가 없으면 유효한 publish subject
[[nodiscard]] bool isValidSubject(std::string_view subject) noexcept;

/// 구독 패턴 검증: '*' 는 토큰 하나, '>' 는 마지막 토큰에서만 허용
[[nodiscard]] bool isValidPattern(std::string_view pattern) noexcept;

/// NATS 와일드카드 의미로 매칭합니다.
///  - "*" : 정확히 한 토큰
///  - ">" : 남은 토큰 1개 이상 (마지막 위치에서만)
[[nodiscard]] bool subjectMatches(std::string_view pattern, std::string_view subject) noexcept;

} // namespace mudcast::bus
