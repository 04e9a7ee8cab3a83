#pragma once

#include <mudcast/transport/BufferedFdTransport.hpp>

#include <cstddef>

namespace mudcast::transport
{

/// 업그레이드가 끝난 WebSocket 연결 (primary transport)
///
/// - 송신: 마스크 없는 text 프레임
/// - 수신: 마스킹된 text 프레임만 메시지로 넘기고, ping 에는 pong 으로 응답,
///   close 프레임을 받으면 close 로 응답한 뒤 연결을 닫습니다.
/// - 분할(continuation) 프레임은 지원하지 않습니다. (프로토콜 오류로 닫음)
class WebSocketTransport final : public BufferedFdTransport
{
  public:
    static constexpr std::size_t kDefaultMaxInboundFrame = 64 * 1024;

    WebSocketTransport(mudcast::net::Socket socket, std::size_t sendBufferBytes,
                       std::size_t maxInboundFrame = kDefaultMaxInboundFrame);

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::WebSocket; }

  protected:
    [[nodiscard]] std::string encodeFrame(std::string_view eventType,
                                          std::string_view payload) const override;
    bool decodeInbound(std::string &inbuf, std::vector<std::string> &out) override;

  private:
    std::size_t maxInboundFrame_;
};

} // namespace mudcast::transport
