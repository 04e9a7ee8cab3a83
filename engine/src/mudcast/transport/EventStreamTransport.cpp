#include <mudcast/transport/EventStreamTransport.hpp>

namespace mudcast::transport
{

EventStreamTransport::EventStreamTransport(mudcast::net::Socket socket,
                                           std::size_t sendBufferBytes)
    : BufferedFdTransport(std::move(socket), sendBufferBytes)
{
}

std::string EventStreamTransport::encodeFrame(std::string_view eventType,
                                              std::string_view payload) const
{
    std::string out;
    out.reserve(eventType.size() + payload.size() + 16);
    if (!eventType.empty())
    {
        out.append("event: ");
        out.append(eventType);
        out.push_back('\n');
    }

    // data 안의 개행은 줄마다 "data: " 접두어로 나눈다. (compact JSON 이면 한 줄)
    out.append("data: ");
    for (char c : payload)
    {
        if (c == '\n')
            out.append("\ndata: ");
        else
            out.push_back(c);
    }
    out.append("\n\n");
    return out;
}

SendResult EventStreamTransport::sendKeepAlive()
{
    return sendRaw(": keepalive\n\n");
}

bool EventStreamTransport::decodeInbound(std::string &inbuf, std::vector<std::string> & /*out*/)
{
    inbuf.clear();
    return true;
}

} // namespace mudcast::transport
