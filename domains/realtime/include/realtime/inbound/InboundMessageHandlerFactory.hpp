#pragma once

#include <realtime/inbound/IInboundHandler.hpp>
#include <realtime/inbound/RateLimiter.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace realtime::inbound
{

enum class HandleResult
{
    Dispatched,
    UnknownType,
    Malformed,
    RateLimited,
    Failed, // handler 가 예외를 던짐
};

/// 클라이언트 프레임 {type, data} 디스패처
///
/// - "command" 와 "game_command" 는 같은 handler 를 쓴다.
/// - data 가 없으면 {} 로 채운다.
/// - 모르는 type 은 INVALID_COMMAND, JSON 오류/object 아님은 INVALID_FORMAT 을 보낸 연결에 응답
/// - rateLimiter 가 있으면 연결별 제한 초과 시 RATE_LIMIT_EXCEEDED
class InboundMessageHandlerFactory
{
  public:
    explicit InboundMessageHandlerFactory(std::shared_ptr<RateLimiter> rateLimiter = nullptr) : rateLimiter_(std::move(rateLimiter)) {}

    void registerHandler(std::string type, std::shared_ptr<IInboundHandler> handler);

    [[nodiscard]] bool hasHandler(std::string_view type) const;

    HandleResult handle(const InboundContext &ctx, std::string_view rawFrame);

    /// 연결 종료 시 rate limit 기록 정리
    void forgetConnection(std::uint64_t connectionId);

  private:
    [[nodiscard]] static std::string_view canonicalType(std::string_view type) noexcept;
    [[nodiscard]] std::shared_ptr<IInboundHandler> find(std::string_view type) const;

    std::shared_ptr<RateLimiter> rateLimiter_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IInboundHandler>, std::less<>> handlers_;
};

} // namespace realtime::inbound
