#include <mudcast/core/Logger.hpp>
#include <mudcast/core/ThreadContext.hpp>
#include <mudcast/util/SpinLock.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace mudcast::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

const char *logLevelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

// =============================================================================
// Logger::Impl
// =============================================================================
class Logger::Impl
{
  public:
    Impl(std::ostream &os, LogLevel minLevel) : os_(os), minLevel_(minLevel)
    {
        worker_ = std::thread([this] {
            ThreadContext::setCurrentRole("log");
            run();
        });
    }

    ~Impl() { stop(); }

    void push(LogLevel level, std::string_view message)
    {
        Record rec{level, std::chrono::system_clock::now(), std::string(ttag()), tid(), std::string(message)};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            pending_.push_back(std::move(rec));
        }
        cv_.notify_one();
    }

    void stop() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
            worker_.join();
    }

    std::atomic<LogLevel> &minLevel() noexcept { return minLevel_; }

  private:
    struct Record
    {
        LogLevel level;
        std::chrono::system_clock::time_point at;
        std::string tag;
        long tid;
        std::string message;
    };

    void run()
    {
        std::deque<Record> batch;
        for (;;)
        {
            bool last = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                batch.swap(pending_);
                last = stopping_;
            }

            const LogLevel min = minLevel_.load(std::memory_order_relaxed);
            for (const auto &rec : batch)
            {
                if (rec.level >= min)
                    write(rec);
            }
            batch.clear();
            os_.flush();

            if (last)
                return;
        }
    }

    void write(const Record &rec)
    {
        using namespace std::chrono;

        const std::time_t secs = system_clock::to_time_t(rec.at);
        std::tm local{};
        ::localtime_r(&secs, &local);
        const auto micros = duration_cast<microseconds>(rec.at.time_since_epoch()).count() % 1000000;

        os_ << fmt::format("{:02}:{:02}:{:02}.{:06} | {} tid={} | {:<5} | {}\n", local.tm_hour, local.tm_min, local.tm_sec, micros, rec.tag, rec.tid,
                           logLevelName(rec.level), rec.message);
    }

    std::ostream &os_;
    std::atomic<LogLevel> minLevel_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Record> pending_;
    bool stopping_{false};

    std::thread worker_;
};

Logger::Logger(std::ostream &os, LogLevel minLevel) : impl_(std::make_unique<Impl>(os, minLevel)) {}

Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    if (level >= minLevel())
        impl_->push(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->minLevel().store(level, std::memory_order_relaxed);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel().load(std::memory_order_relaxed);
}

void Logger::flushAndStop() noexcept
{
    impl_->stop();
}

// =============================================================================
// 전역 logger 슬롯
// =============================================================================
namespace
{
struct GlobalSlot
{
    mudcast::util::SpinLock lock;
    std::shared_ptr<ILogger> logger;
};

GlobalSlot &globalSlot()
{
    static GlobalSlot slot;
    return slot;
}
} // namespace

std::shared_ptr<ILogger> currentLogger()
{
    auto &slot = globalSlot();
    {
        mudcast::util::SpinLockGuard guard(slot.lock);
        if (slot.logger)
            return slot.logger;
    }

    // 스레드 생성은 잠금 밖에서. 경합에서 진 쪽은 그냥 버려진다.
    auto fallback = std::make_shared<Logger>(std::clog, LogLevel::Info);
    mudcast::util::SpinLockGuard guard(slot.lock);
    if (!slot.logger)
        slot.logger = std::move(fallback);
    return slot.logger;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel level = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);

    std::shared_ptr<ILogger> previous;
    {
        mudcast::util::SpinLockGuard guard(globalSlot().lock);
        previous = std::exchange(globalSlot().logger, std::move(logger));
    }
    // previous 의 소멸(스레드 join)은 잠금 밖에서 일어난다.
}

void shutdownLogger() noexcept
{
    std::shared_ptr<ILogger> installed;
    {
        mudcast::util::SpinLockGuard guard(globalSlot().lock);
        installed = std::move(globalSlot().logger);
    }
    if (installed)
        installed->shutdown();
}

} // namespace mudcast::core
