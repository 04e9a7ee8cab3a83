#include <mudcast/transport/WebSocketTransport.hpp>
#include <mudcast/transport/WebSocketFrame.hpp>

#include <mudcast/core/Logger.hpp>

namespace mudcast::transport
{

WebSocketTransport::WebSocketTransport(mudcast::net::Socket socket, std::size_t sendBufferBytes,
                                       std::size_t maxInboundFrame)
    : BufferedFdTransport(std::move(socket), sendBufferBytes), maxInboundFrame_(maxInboundFrame)
{
}

std::string WebSocketTransport::encodeFrame(std::string_view /*eventType*/,
                                            std::string_view payload) const
{
    return ws::encodeServerFrame(ws::Opcode::Text, payload);
}

bool WebSocketTransport::decodeInbound(std::string &inbuf, std::vector<std::string> &out)
{
    std::size_t offset = 0;
    bool keepOpen = true;

    while (keepOpen && offset < inbuf.size())
    {
        ws::DecodedFrame frame;
        std::size_t consumed = 0;
        const auto st = ws::decodeClientFrame(std::string_view(inbuf).substr(offset),
                                              maxInboundFrame_, frame, consumed);
        if (st == ws::DecodeStatus::NeedMore)
            break;
        if (st == ws::DecodeStatus::ProtocolError)
        {
            SLOG_WARN("WebSocket", "ProtocolError", "id={} buffered={}", id(), inbuf.size());
            (void)sendRaw(ws::encodeServerFrame(ws::Opcode::Close, "\x03\xea")); // 1002
            inbuf.clear();
            return false;
        }
        offset += consumed;

        switch (frame.opcode)
        {
        case ws::Opcode::Text:
            if (!frame.fin)
            {
                SLOG_WARN("WebSocket", "Fragmented", "id={}", id());
                keepOpen = false;
                break;
            }
            out.push_back(std::move(frame.payload));
            break;
        case ws::Opcode::Ping:
            (void)sendRaw(ws::encodeServerFrame(ws::Opcode::Pong, frame.payload));
            break;
        case ws::Opcode::Pong:
            break;
        case ws::Opcode::Close:
            (void)sendRaw(ws::encodeServerFrame(ws::Opcode::Close, frame.payload));
            keepOpen = false;
            break;
        default:
            SLOG_WARN("WebSocket", "UnsupportedOpcode", "id={} opcode={}", id(),
                      static_cast<int>(frame.opcode));
            keepOpen = false;
            break;
        }
    }

    inbuf.erase(0, offset);
    return keepOpen;
}

} // namespace mudcast::transport
