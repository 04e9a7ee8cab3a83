#pragma once

#include <mudcast/transport/BufferedFdTransport.hpp>

namespace mudcast::transport
{

/// 장수명 HTTP event-stream 연결 (fallback transport, 서버 -> 클라이언트 단방향)
///
/// 프레임: "event: <type>\ndata: <json>\n\n"
/// 클라이언트 입력은 받지 않으며, readFrames 는 peer close 감지에만 쓰입니다.
class EventStreamTransport final : public BufferedFdTransport
{
  public:
    EventStreamTransport(mudcast::net::Socket socket, std::size_t sendBufferBytes);

    [[nodiscard]] TransportKind kind() const noexcept override
    {
        return TransportKind::EventStream;
    }

    /// 프록시 idle timeout 방지용 주석 라인 (": keepalive\n\n")
    SendResult sendKeepAlive();

  protected:
    [[nodiscard]] std::string encodeFrame(std::string_view eventType,
                                          std::string_view payload) const override;
    bool decodeInbound(std::string &inbuf, std::vector<std::string> &out) override;
};

} // namespace mudcast::transport
