#include <mudcast/bus/NatsBrokerClient.hpp>
#include <mudcast/bus/SubjectPattern.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/core/ThreadContext.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <sys/socket.h>

namespace mudcast::bus
{
namespace
{
constexpr std::uint32_t kReaderPollMs = 200;
constexpr std::size_t kReadChunk = 16 * 1024;
} // namespace

NatsBrokerClient::NatsBrokerClient(Options opt) : opt_(std::move(opt)) {}

NatsBrokerClient::~NatsBrokerClient()
{
    disconnect();
}

void NatsBrokerClient::connect()
{
    std::lock_guard<std::mutex> connectLock(connectMutex_);
    if (isConnected())
        return;

    // 이전 세션의 reader 가 남아 있으면 정리 (reader 는 connectMutex_ 를 잡지 않는다)
    stopReader();

    auto sock = mudcast::net::Socket::createTcpIPv4();
    if (!sock.isValid())
        throw BrokerError(std::string("nats: socket() failed: ") + std::strerror(errno));
    (void)sock.setNoDelay(true);
    (void)sock.setRecvTimeoutMs(opt_.connectTimeoutMs);

    // bus worker 가 호출하므로 SYN 타임아웃까지 묶이지 않게 상한을 둔다.
    if (!sock.connect(opt_.host, opt_.port, opt_.connectTimeoutMs))
        throw BrokerError("nats: connect " + opt_.host + ":" + std::to_string(opt_.port) +
                          " failed: " + std::strerror(errno));

    // 서버는 접속 직후 INFO 한 줄을 보낸다.
    nats::Parser parser;
    nats::ServerOp op;
    std::array<char, 4096> chunk{};
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(opt_.connectTimeoutMs);
    bool gotInfo = false;
    while (!gotInfo)
    {
        if (std::chrono::steady_clock::now() >= deadline)
            throw BrokerError("nats: timed out waiting for INFO");

        const auto n = sock.recv(chunk.data(), chunk.size());
        if (n == 0)
            throw BrokerError("nats: server closed during handshake");
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            throw BrokerError(std::string("nats: handshake recv failed: ") + std::strerror(errno));
        }
        parser.feed(std::string_view(chunk.data(), static_cast<std::size_t>(n)));
        try
        {
            while (parser.next(op))
            {
                if (op.kind == nats::ServerOp::Kind::Info)
                    gotInfo = true;
                else if (op.kind == nats::ServerOp::Kind::Err)
                    throw BrokerError("nats: server error: " + op.payload);
            }
        }
        catch (const std::runtime_error &e)
        {
            throw BrokerError(std::string("nats: handshake: ") + e.what());
        }
    }

    (void)sock.setRecvTimeoutMs(kReaderPollMs);

    std::string hello = nats::encodeConnect(opt_.connect);
    std::size_t resubscribed = 0;
    {
        // 재접속이면 기존 구독을 같은 sid 로 다시 건다.
        std::lock_guard<std::mutex> subsLock(subsMutex_);
        for (const auto &[sid, sub] : subs_)
            hello += nats::encodeSub(sub.pattern, sid);
        resubscribed = subs_.size();
    }
    hello.append(nats::kPing);

    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        socket_ = std::move(sock);
        sendAllLocked(hello);
    }

    stopping_.store(false, std::memory_order_release);
    connected_.store(true, std::memory_order_release);
    reader_ = std::thread([this]() { readerLoop(); });

    SLOG_INFO("Nats", "Connected", "host={} port={} subs={}", opt_.host, opt_.port, resubscribed);
}

void NatsBrokerClient::disconnect() noexcept
{
    std::lock_guard<std::mutex> connectLock(connectMutex_);
    connected_.store(false, std::memory_order_release);
    stopReader();
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    socket_.close();
}

void NatsBrokerClient::stopReader() noexcept
{
    stopping_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        socket_.shutdownBoth();
    }
    if (reader_.joinable())
        reader_.join();
}

void NatsBrokerClient::sendAllLocked(std::string_view bytes)
{
    std::size_t off = 0;
    while (off < bytes.size())
    {
        const auto n = socket_.send(bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
        if (n > 0)
        {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        throw BrokerError(std::string("nats: send failed: ") + std::strerror(errno));
    }
}

void NatsBrokerClient::sendOrMarkDown(std::string_view bytes)
{
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    try
    {
        sendAllLocked(bytes);
    }
    catch (const BrokerError &)
    {
        connected_.store(false, std::memory_order_release);
        throw;
    }
}

void NatsBrokerClient::publish(std::string_view subject, std::string_view payload)
{
    if (!isValidSubject(subject))
        throw BrokerError("nats: invalid subject: " + std::string(subject));

    if (!isConnected())
        connect(); // BrokerError 는 호출자(bus)에게 그대로 전달되어 재시도 대상이 된다.

    sendOrMarkDown(nats::encodePub(subject, payload));
}

IBrokerClient::SubscriptionId NatsBrokerClient::subscribe(std::string_view pattern,
                                                          MessageHandler handler)
{
    if (!isValidPattern(pattern))
        throw std::invalid_argument("nats: invalid subject pattern: " + std::string(pattern));

    SubscriptionId sid = 0;
    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        sid = nextSid_++;
        subs_.emplace(sid, Sub{std::string(pattern), std::make_shared<MessageHandler>(std::move(handler))});
    }

    if (isConnected())
    {
        try
        {
            sendOrMarkDown(nats::encodeSub(pattern, sid));
        }
        catch (const BrokerError &e)
        {
            // 등록은 유지된다. 재접속 시 connect()가 다시 SUB 한다.
            SLOG_WARN("Nats", "SubDeferred", "pattern={} sid={} err={}", pattern, sid, e.what());
        }
    }
    return sid;
}

void NatsBrokerClient::unsubscribe(SubscriptionId id)
{
    {
        std::lock_guard<std::mutex> lock(subsMutex_);
        if (subs_.erase(id) == 0)
            return;
    }

    if (isConnected())
    {
        try
        {
            sendOrMarkDown(nats::encodeUnsub(id));
        }
        catch (const BrokerError &e)
        {
            // 끊긴 연결의 구독은 서버 쪽에서 이미 사라졌다.
            SLOG_DEBUG("Nats", "UnsubOnDeadLink", "sid={} err={}", id, e.what());
        }
    }
}

void NatsBrokerClient::readerLoop()
{
    mudcast::core::ThreadContext::setCurrentRole("nats-rx");

    nats::Parser parser;
    nats::ServerOp op;
    std::vector<char> chunk(kReadChunk);

    while (!stopping_.load(std::memory_order_acquire))
    {
        const auto n = socket_.recv(chunk.data(), chunk.size());
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            continue; // poll timeout: stop 플래그 재확인
        if (n <= 0)
        {
            if (!stopping_.load(std::memory_order_acquire))
                SLOG_WARN("Nats", "LinkDown", "host={} port={} errno={}", opt_.host, opt_.port, errno);
            break;
        }

        parser.feed(std::string_view(chunk.data(), static_cast<std::size_t>(n)));
        try
        {
            while (parser.next(op))
            {
                switch (op.kind)
                {
                case nats::ServerOp::Kind::Msg: {
                    std::shared_ptr<MessageHandler> h;
                    {
                        std::lock_guard<std::mutex> lock(subsMutex_);
                        auto it = subs_.find(op.sid);
                        if (it != subs_.end())
                            h = it->second.handler;
                    }
                    if (h)
                        (*h)(op.subject, op.payload);
                    break;
                }
                case nats::ServerOp::Kind::Ping:
                    sendOrMarkDown(nats::kPong);
                    break;
                case nats::ServerOp::Kind::Err:
                    SLOG_ERROR("Nats", "ServerError", "err={}", op.payload);
                    break;
                case nats::ServerOp::Kind::Pong:
                case nats::ServerOp::Kind::Ok:
                case nats::ServerOp::Kind::Info:
                    break;
                }
            }
        }
        catch (const std::runtime_error &e)
        {
            SLOG_ERROR("Nats", "ProtocolError", "err={}", e.what());
            break;
        }
    }

    connected_.store(false, std::memory_order_release);
}

} // namespace mudcast::bus
