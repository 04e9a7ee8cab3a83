#pragma once

#include <mudcast/buffer/RingBuffer.hpp>
#include <mudcast/net/Socket.hpp>
#include <mudcast/transport/ITransport.hpp>
#include <mudcast/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mudcast::transport
{

/// 논블로킹 소켓 + 고정 용량 outbound 버퍼를 가진 transport 공통 구현.
///
/// ===== 규약 =====
/// - 프레임 인코딩(encodeFrame)과 inbound 해석(decodeInbound)만 파생 클래스가 정의합니다.
/// - 송신은 "버퍼에 통째로 넣고 → 보낼 수 있는 만큼 즉시 flush" 입니다.
///   버퍼에 프레임 전체가 들어갈 자리가 없으면 Backpressure 를 반환하고 아무것도 쓰지 않습니다.
/// - 쓰기 오류(EPIPE 등)는 transport 를 닫고 Closed 를 반환합니다.
/// - readFrames() 는 단일 reader 스레드(보통 노드 루프)에서만 호출합니다.
class BufferedFdTransport : public ITransport, private mudcast::util::NonCopyable
{
  public:
    BufferedFdTransport(mudcast::net::Socket socket, std::size_t sendBufferBytes);
    ~BufferedFdTransport() override;

    [[nodiscard]] Id id() const noexcept override { return id_; }
    [[nodiscard]] bool isOpen() const noexcept override
    {
        return open_.load(std::memory_order_acquire);
    }

    SendResult sendText(std::string_view eventType, std::string_view payload) override;
    std::size_t readFrames(std::vector<std::string> &out) override;
    std::size_t flushPending() override;
    void close() noexcept override;

    /// 남아 있는 outbound 바이트를 가능한 만큼 보냅니다. (EPOLLOUT 등에서 호출)
    SendResult flush();

    [[nodiscard]] std::size_t pendingBytes() const;
    [[nodiscard]] int nativeHandle() const noexcept { return fd_; }

  protected:
    /// 프레임 바이트열로 인코딩
    [[nodiscard]] virtual std::string encodeFrame(std::string_view eventType,
                                                  std::string_view payload) const = 0;

    /// inbound 누적 버퍼에서 완성된 텍스트 메시지를 꺼냅니다. 소비한 바이트는 직접 지웁니다.
    ///
    /// @return false 면 프로토콜 오류 또는 정상 종료 요청으로 연결을 닫아야 함
    virtual bool decodeInbound(std::string &inbuf, std::vector<std::string> &out) = 0;

    /// 제어 프레임 등 이미 인코딩된 바이트를 그대로 넣습니다.
    SendResult sendRaw(std::string_view frame);

  private:
    SendResult flushLocked();
    void closeLocked() noexcept;

    const Id id_;
    const int fd_;

    mutable std::mutex mutex_;
    mudcast::net::Socket socket_;
    mudcast::buffer::RingBuffer outbound_;
    std::atomic<bool> open_{true};

    std::string inbuf_; // reader 스레드 전용
};

} // namespace mudcast::transport
