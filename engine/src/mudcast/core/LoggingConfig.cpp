#include <mudcast/core/LoggingConfig.hpp>
#include <mudcast/core/Logger.hpp>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

namespace mudcast::core
{
namespace
{

// Logger 는 stream 을 참조만 하므로 파일 sink 는 ofstream 을 직접 들고 있어야 한다.
// 멤버 순서: file_ 이 logger_ 보다 먼저 생성되고 나중에 소멸한다.
class FileLogger final : public ILogger
{
  public:
    FileLogger(const std::string &path, LogLevel level) : file_(path, std::ios::out | std::ios::app)
    {
        if (!file_.is_open())
            throw std::runtime_error("cannot open log file: " + path);
        logger_ = std::make_unique<Logger>(file_, level);
    }

    ~FileLogger() override { logger_->flushAndStop(); }

    void log(LogLevel level, std::string_view message) override { logger_->log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_->minLevel(); }
    void shutdown() noexcept override { logger_->flushAndStop(); }

  private:
    std::ofstream file_;
    std::unique_ptr<Logger> logger_;
};

} // namespace

void applyLoggingConfig(const NodeConfig &cfg)
{
    std::shared_ptr<ILogger> sink;
    if (cfg.logFilePath.empty())
        sink = std::make_shared<Logger>(std::clog, cfg.logLevel);
    else
        sink = std::make_shared<FileLogger>(cfg.logFilePath, cfg.logLevel);

    setLogger(std::move(sink));
    SLOG_INFO("Logging", "Configured", "node={} level={} sink={}", cfg.processId.empty() ? std::string("-") : cfg.processId,
              logLevelName(cfg.logLevel), cfg.logFilePath.empty() ? std::string("stderr") : cfg.logFilePath);
}

} // namespace mudcast::core
