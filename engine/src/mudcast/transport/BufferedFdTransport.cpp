#include <mudcast/transport/BufferedFdTransport.hpp>

#include <mudcast/core/Logger.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>

namespace mudcast::transport
{

ITransport::Id allocateTransportId() noexcept
{
    static std::atomic<ITransport::Id> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

namespace
{
constexpr std::size_t kMaxIovBytes = 64 * 1024;
constexpr std::size_t kReadChunk = 4096;
constexpr int kSendFlags = MSG_DONTWAIT | MSG_NOSIGNAL;
} // namespace

BufferedFdTransport::BufferedFdTransport(mudcast::net::Socket socket, std::size_t sendBufferBytes)
    : id_(allocateTransportId()), fd_(socket.nativeHandle()), socket_(std::move(socket)),
      outbound_(sendBufferBytes)
{
    if (!socket_.isValid())
        open_.store(false, std::memory_order_release);
}

BufferedFdTransport::~BufferedFdTransport()
{
    close();
}

SendResult BufferedFdTransport::sendText(std::string_view eventType, std::string_view payload)
{
    return sendRaw(encodeFrame(eventType, payload));
}

SendResult BufferedFdTransport::sendRaw(std::string_view frame)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_.load(std::memory_order_relaxed))
        return SendResult::Closed;

    if (!outbound_.tryAppend(frame, {}))
    {
        // 먼저 비워 보고 그래도 자리가 없으면 느린 소비자로 판단
        if (flushLocked() == SendResult::Closed)
            return SendResult::Closed;
        if (!outbound_.tryAppend(frame, {}))
        {
            SLOG_WARN("Transport", "Backpressure", "id={} pending={} frame={}", id_,
                      outbound_.size(), frame.size());
            return SendResult::Backpressure;
        }
    }

    return flushLocked();
}

SendResult BufferedFdTransport::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_.load(std::memory_order_relaxed))
        return SendResult::Closed;
    return flushLocked();
}

std::size_t BufferedFdTransport::flushPending()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_.load(std::memory_order_relaxed) || outbound_.empty())
        return 0;
    if (flushLocked() == SendResult::Closed)
        return 0;
    return outbound_.size();
}

SendResult BufferedFdTransport::flushLocked()
{
    while (!outbound_.empty())
    {
        ::iovec iov[2];
        const int n = outbound_.peekIov(iov, kMaxIovBytes);
        if (n <= 0)
            break;

        const ::ssize_t sent = socket_.sendIov(iov, n, kSendFlags);
        if (sent > 0)
        {
            outbound_.consume(static_cast<std::size_t>(sent));
            continue;
        }

        if (sent < 0 && errno == EINTR)
            continue;
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break; // 커널 버퍼가 가득 참. 남은 건 다음 flush 에서

        SLOG_DEBUG("Transport", "WriteFailed", "id={} errno={} msg={}", id_, errno,
                   std::strerror(errno));
        closeLocked();
        return SendResult::Closed;
    }
    return SendResult::Queued;
}

std::size_t BufferedFdTransport::readFrames(std::vector<std::string> &out)
{
    if (!isOpen())
        return 0;

    std::array<char, kReadChunk> chunk{};
    for (;;)
    {
        ::ssize_t n = -1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_.load(std::memory_order_relaxed))
                return 0;
            n = socket_.recv(chunk.data(), chunk.size(), MSG_DONTWAIT);
        }

        if (n > 0)
        {
            inbuf_.append(chunk.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;

        // n == 0 (peer closed) 또는 읽기 오류
        const std::size_t before = out.size();
        (void)decodeInbound(inbuf_, out);
        close();
        return out.size() - before;
    }

    const std::size_t before = out.size();
    if (!decodeInbound(inbuf_, out))
    {
        SLOG_INFO("Transport", "InboundClose", "id={}", id_);
        close();
    }
    return out.size() - before;
}

std::size_t BufferedFdTransport::pendingBytes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

void BufferedFdTransport::close() noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void BufferedFdTransport::closeLocked() noexcept
{
    if (!open_.exchange(false, std::memory_order_acq_rel))
        return;
    outbound_.clear();
    socket_.shutdownBoth();
    socket_.close();
}

} // namespace mudcast::transport
