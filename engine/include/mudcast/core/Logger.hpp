#pragma once

#include <mudcast/util/NonCopyable.hpp>

#include <fmt/format.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace mudcast::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

[[nodiscard]] const char *logLevelName(LogLevel level) noexcept;

namespace detail
{
// 설치된 logger 의 min level 사본. 포맷 비용 전에 거른다.
std::atomic<int> &fastMinLevel();
} // namespace detail

[[nodiscard]] inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

/// log sink. 구현은 여러 스레드에서 동시에 불린다.
class ILogger : private mudcast::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 비동기 stream Logger
///
/// - log() 는 호출 스레드의 시각/thread tag 만 찍어 큐에 넣고 바로 돌아간다.
/// - 전용 "log" 스레드가 배치로 꺼내 "HH:MM:SS.uuuuuu | tag tid=N | LEVEL | message" 를 쓴다.
/// - flushAndStop() 은 남은 라인을 모두 쓴 뒤 스레드를 join 한다. 이후 log() 는 버려진다.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog, LogLevel minLevel = LogLevel::Info);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    void flushAndStop() noexcept;
    void shutdown() noexcept override { flushAndStop(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// ----- 프로세스 전역 logger -----
// 설정 전이거나 shutdownLogger() 이후에는 std::clog 로 쓰는 기본 Logger 를 만든다.
[[nodiscard]] std::shared_ptr<ILogger> currentLogger();
// fast level filter 도 logger->minLevel() 로 맞춘다. nullptr 이면 기본값(Info)으로 되돌린다.
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// SLOG_*(comp, evt[, fmt, args...])
//   message = "comp | evt" 또는 "comp | evt | k=v ..."
//   시각/thread/level prefix 는 sink 가 붙인다.
// =============================================================================
namespace slog
{
[[nodiscard]] inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    return details.empty() ? fmt::format("{} | {}", comp, evt) : fmt::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (fastEnabled(lvl))
        currentLogger()->log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt, fmt::format_string<Args...> fmtStr, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    const std::string details = fmt::format(fmtStr, std::forward<Args>(args)...);
    currentLogger()->log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Trace, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Debug, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Info, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Warn, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Error, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::mudcast::core::slog::emit(::mudcast::core::LogLevel::Fatal, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace mudcast::core
