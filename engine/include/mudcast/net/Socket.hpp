#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>

#include <mudcast/util/NonCopyable.hpp>

namespace mudcast::net {

/// 소유권을 가진 blocking 소켓 fd (move-only)
///
/// 클라이언트 transport 와 NATS broker client 가 같이 쓴다.
/// 실패는 false / -1 / invalid Socket 으로 돌려주고 errno 는 그대로 남긴다.
/// 닫힌 소켓에 대한 호출은 EBADF.
class Socket : private mudcast::util::NonCopyable {
  public:
    using Handle = int;

    Socket() noexcept = default;
    explicit Socket(Handle fd) noexcept : fd_(fd) {}
    ~Socket() noexcept { close(); }

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    [[nodiscard]] static Socket createTcpIPv4() noexcept;

    // 테스트용 AF_UNIX 연결 쌍
    [[nodiscard]] static bool createStreamPair(Socket &a, Socket &b) noexcept;

    void close() noexcept;

    /// 다른 스레드의 blocking recv 를 깨운다. fd 는 닫지 않는다.
    void shutdownBoth() noexcept;

    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;
    /// 0 = 무기한
    [[nodiscard]] bool setRecvTimeoutMs(std::uint32_t ms) noexcept;

    // ip 는 dotted IPv4 문자열. 파싱 실패는 EINVAL.
    [[nodiscard]] bool bind(const std::string &ip, std::uint16_t port) noexcept;
    [[nodiscard]] bool connect(const std::string &ip, std::uint16_t port) noexcept;
    /// 논블로킹 connect + poll. timeoutMs 안에 안 되면 ETIMEDOUT (0 = 무기한). 끝나면 blocking 모드로 되돌린다.
    [[nodiscard]] bool connect(const std::string &ip, std::uint16_t port, std::uint32_t timeoutMs) noexcept;
    [[nodiscard]] bool listen(int backlog) noexcept;
    [[nodiscard]] Socket accept() noexcept;

    /// getsockname 포트 (실패 시 0)
    [[nodiscard]] std::uint16_t localPort() const noexcept;

    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t sendIov(const ::iovec *iov, int iovCount, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len, int flags = 0) noexcept;

  private:
    [[nodiscard]] bool ensureOpen() const noexcept;
    [[nodiscard]] bool setFlag(int level, int name, bool enable) noexcept;
    [[nodiscard]] bool setBlocking(bool blocking) noexcept;

    Handle fd_{-1};
};

} // namespace mudcast::net
