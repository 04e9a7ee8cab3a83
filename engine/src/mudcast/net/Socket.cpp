#include <mudcast/net/Socket.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

#include <utility>

namespace mudcast::net
{
namespace
{

// "a.b.c.d" + port -> sockaddr_in. 실패 시 errno=EINVAL.
bool makeIPv4(const std::string &ip, std::uint16_t port, ::sockaddr_in &out) noexcept
{
    out = ::sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1)
        return true;
    errno = EINVAL;
    return false;
}

const ::sockaddr *asGeneric(const ::sockaddr_in &addr) noexcept
{
    return reinterpret_cast<const ::sockaddr *>(&addr);
}

} // namespace

Socket::Socket(Socket &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

bool Socket::ensureOpen() const noexcept
{
    if (fd_ >= 0)
        return true;
    errno = EBADF;
    return false;
}

bool Socket::setFlag(int level, int name, bool enable) noexcept
{
    if (!ensureOpen())
        return false;
    const int value = enable ? 1 : 0;
    return ::setsockopt(fd_, level, name, &value, sizeof(value)) == 0;
}

Socket Socket::createTcpIPv4() noexcept
{
    // 실패하면 fd=-1 이 그대로 invalid Socket 이 된다.
    return Socket{::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)};
}

bool Socket::createStreamPair(Socket &a, Socket &b) noexcept
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0)
        return false;
    a = Socket{fds[0]};
    b = Socket{fds[1]};
    return true;
}

void Socket::close() noexcept
{
    const Handle fd = std::exchange(fd_, -1);
    if (fd >= 0)
        ::close(fd);
}

void Socket::shutdownBoth() noexcept
{
    if (fd_ >= 0)
        (void)::shutdown(fd_, SHUT_RDWR);
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    return setFlag(SOL_SOCKET, SO_REUSEADDR, enable);
}

bool Socket::setNoDelay(bool enable) noexcept
{
    return setFlag(IPPROTO_TCP, TCP_NODELAY, enable);
}

bool Socket::setRecvTimeoutMs(std::uint32_t ms) noexcept
{
    if (!ensureOpen())
        return false;

    ::timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool Socket::bind(const std::string &ip, std::uint16_t port) noexcept
{
    ::sockaddr_in addr;
    if (!ensureOpen() || !makeIPv4(ip, port, addr))
        return false;
    return ::bind(fd_, asGeneric(addr), sizeof(addr)) == 0;
}

bool Socket::connect(const std::string &ip, std::uint16_t port) noexcept
{
    ::sockaddr_in addr;
    if (!ensureOpen() || !makeIPv4(ip, port, addr))
        return false;

    int rc;
    do
    {
        rc = ::connect(fd_, asGeneric(addr), sizeof(addr));
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
}

bool Socket::connect(const std::string &ip, std::uint16_t port, std::uint32_t timeoutMs) noexcept
{
    ::sockaddr_in addr;
    if (!ensureOpen() || !makeIPv4(ip, port, addr) || !setBlocking(false))
        return false;

    bool ok = ::connect(fd_, asGeneric(addr), sizeof(addr)) == 0;
    if (!ok && errno == EINPROGRESS)
    {
        ::pollfd pfd{fd_, POLLOUT, 0};
        int rc;
        do
        {
            rc = ::poll(&pfd, 1, timeoutMs == 0 ? -1 : static_cast<int>(timeoutMs));
        } while (rc < 0 && errno == EINTR);

        int soError = 0;
        ::socklen_t len = sizeof(soError);
        if (rc == 0)
            errno = ETIMEDOUT;
        else if (rc > 0 && ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soError, &len) == 0)
        {
            ok = soError == 0;
            if (!ok)
                errno = soError;
        }
    }

    const int err = errno;
    if (!setBlocking(true))
        return false;
    errno = err;
    return ok;
}

bool Socket::setBlocking(bool blocking) noexcept
{
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0)
        return false;
    const int wanted = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return wanted == flags || ::fcntl(fd_, F_SETFL, wanted) == 0;
}

bool Socket::listen(int backlog) noexcept
{
    return ensureOpen() && ::listen(fd_, backlog) == 0;
}

Socket Socket::accept() noexcept
{
    if (!ensureOpen())
        return Socket{};
    return Socket{::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC)};
}

std::uint16_t Socket::localPort() const noexcept
{
    if (fd_ < 0)
        return 0;

    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<::sockaddr *>(&addr), &len) != 0)
        return 0;
    return ntohs(addr.sin_port);
}

::ssize_t Socket::send(const void *data, std::size_t len, int flags) noexcept
{
    return ensureOpen() ? ::send(fd_, data, len, flags) : -1;
}

::ssize_t Socket::sendIov(const ::iovec *iov, int iovCount, int flags) noexcept
{
    if (!ensureOpen())
        return -1;

    ::msghdr msg{};
    msg.msg_iov = const_cast<::iovec *>(iov);
    msg.msg_iovlen = static_cast<std::size_t>(iovCount);
    return ::sendmsg(fd_, &msg, flags);
}

::ssize_t Socket::recv(void *buffer, std::size_t len, int flags) noexcept
{
    return ensureOpen() ? ::recv(fd_, buffer, len, flags) : -1;
}

} // namespace mudcast::net
