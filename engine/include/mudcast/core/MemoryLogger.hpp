#pragma once

#include <mudcast/core/Logger.hpp>

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mudcast::core
{

/// 동기식 캡처 로거 (테스트 전용 sink)
///
/// - log() 호출 스레드에서 즉시 저장하므로, 테스트는 flush 대기 없이 바로 검사할 수 있습니다.
/// - 라인 포맷은 "LEVEL | comp | evt | details" 입니다.
class MemoryLogger final : public ILogger
{
  public:
    explicit MemoryLogger(LogLevel minLevel = LogLevel::Trace) noexcept : minLevel_(minLevel) {}

    [[nodiscard]] LogLevel minLevel() const noexcept override { return minLevel_; }

    void log(LogLevel level, std::string_view message) override
    {
        if (level < minLevel_)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::string(logLevelName(level)) + " | " + std::string(message));
    }

    [[nodiscard]] std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    /// needle 을 포함하는 라인 수
    [[nodiscard]] std::size_t count(std::string_view needle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(lines_.begin(), lines_.end(), [needle](const std::string &l) {
                return l.find(needle) != std::string::npos;
            }));
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

  private:
    LogLevel minLevel_;
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace mudcast::core
