#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mudcast::transport
{

enum class TransportKind
{
    WebSocket,
    EventStream,
};

[[nodiscard]] constexpr std::string_view transportKindName(TransportKind k) noexcept
{
    return k == TransportKind::WebSocket ? "websocket" : "event_stream";
}

/// 한 번의 송신 시도 결과
enum class SendResult
{
    Queued,       ///< outbound 버퍼에 들어감 (이미 일부/전부 flush 되었을 수 있음)
    Backpressure, ///< 버퍼가 가득 참. 느린 소비자
    Closed,       ///< 이미 닫혔거나 쓰기 오류로 닫힘
};

/// 클라이언트 연결 하나의 송신 끝단.
///
/// - sendText 는 절대 블록되지 않습니다. (다른 연결의 I/O 를 기다리지 않음)
/// - close() 이후의 모든 send 는 Closed 를 반환합니다.
class ITransport
{
  public:
    using Id = std::uint64_t;

    virtual ~ITransport() = default;

    [[nodiscard]] virtual Id id() const noexcept = 0;
    [[nodiscard]] virtual TransportKind kind() const noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// eventType 은 event-stream 의 "event:" 라인에 쓰이고, WebSocket 은 무시합니다.
    virtual SendResult sendText(std::string_view eventType, std::string_view payload) = 0;

    /// 클라이언트가 보낸 텍스트 프레임을 논블로킹으로 수거합니다.
    ///
    /// @return 새로 수거한 프레임 수. 단방향 transport 는 항상 0
    virtual std::size_t readFrames(std::vector<std::string> &out) = 0;

    /// 앞선 sendText 에서 커널이 다 받지 못한 바이트를 논블로킹으로 더 내보냅니다.
    ///
    /// 노드 루프가 매 poll 마다 부릅니다. @return 아직 남은 outbound 바이트 수
    virtual std::size_t flushPending() { return 0; }

    virtual void close() noexcept = 0;
};

/// 프로세스 내 유일한 transport id (0은 invalid)
[[nodiscard]] ITransport::Id allocateTransportId() noexcept;

} // namespace mudcast::transport
