#pragma once

#include <mudcast/util/NonCopyable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace mudcast::bus
{

/// 재시도를 모두 소진한 outbound publish 1건
struct DeadLetterEntry
{
    std::uint64_t messageId{0};
    std::string subject;
    std::string payload; // envelope bytes (그대로 보관)
    std::uint32_t attemptCount{0};
    std::string lastError;
    std::string reason; // "retries_exhausted" | "shutdown"
    std::chrono::system_clock::time_point firstFailedAt{};
    std::chrono::system_clock::time_point deadLetteredAt{};
};

/// 검사용 dead-letter 보관소.
///
/// - 메모리에는 최근 capacity 건만 유지합니다. (넘치면 가장 오래된 항목 제거 + warn)
/// - path 가 주어지면 항목마다 JSON 한 줄을 append 합니다. (재전송 도구 입력용)
/// - 여기 들어온 항목은 자동 재전송되지 않습니다.
class DeadLetterStore : private mudcast::util::NonCopyable
{
  public:
    explicit DeadLetterStore(std::size_t capacity, std::string path = {});

    void add(DeadLetterEntry entry);

    [[nodiscard]] std::vector<DeadLetterEntry> list() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t totalWritten() const;
    void clear();

    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    /// 한 줄 JSON 직렬화 (파일 포맷과 동일)
    [[nodiscard]] static std::string toJsonLine(const DeadLetterEntry &e);

  private:
    const std::size_t capacity_;
    const std::string path_;

    mutable std::mutex mutex_;
    std::deque<DeadLetterEntry> entries_;
    std::uint64_t totalWritten_{0};
    std::ofstream file_;
};

} // namespace mudcast::bus
