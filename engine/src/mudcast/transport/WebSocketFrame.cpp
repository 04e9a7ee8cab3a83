#include <mudcast/transport/WebSocketFrame.hpp>

namespace mudcast::transport::ws
{

std::string encodeServerFrame(Opcode opcode, std::string_view payload)
{
    std::string out;
    out.reserve(payload.size() + 10);

    out.push_back(static_cast<char>(0x80 | static_cast<std::uint8_t>(opcode)));

    const std::uint64_t len = payload.size();
    if (len < 126)
    {
        out.push_back(static_cast<char>(len));
    }
    else if (len <= 0xFFFF)
    {
        out.push_back(static_cast<char>(126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    }
    else
    {
        out.push_back(static_cast<char>(127));
        for (int shift = 56; shift >= 0; shift -= 8)
            out.push_back(static_cast<char>((len >> shift) & 0xFF));
    }

    out.append(payload.data(), payload.size());
    return out;
}

DecodeStatus decodeClientFrame(std::string_view buf, std::size_t maxPayload, DecodedFrame &out,
                               std::size_t &consumed)
{
    consumed = 0;
    if (buf.size() < 2)
        return DecodeStatus::NeedMore;

    const auto b0 = static_cast<std::uint8_t>(buf[0]);
    const auto b1 = static_cast<std::uint8_t>(buf[1]);

    // RSV 비트는 확장 협상 없이는 0이어야 한다.
    if ((b0 & 0x70) != 0)
        return DecodeStatus::ProtocolError;
    if ((b1 & 0x80) == 0)
        return DecodeStatus::ProtocolError;

    std::size_t pos = 2;
    std::uint64_t len = b1 & 0x7F;
    if (len == 126)
    {
        if (buf.size() < pos + 2)
            return DecodeStatus::NeedMore;
        len = (static_cast<std::uint64_t>(static_cast<std::uint8_t>(buf[2])) << 8) |
              static_cast<std::uint8_t>(buf[3]);
        pos += 2;
    }
    else if (len == 127)
    {
        if (buf.size() < pos + 8)
            return DecodeStatus::NeedMore;
        len = 0;
        for (std::size_t i = 0; i < 8; ++i)
            len = (len << 8) | static_cast<std::uint8_t>(buf[pos + i]);
        pos += 8;
    }

    if (len > maxPayload)
        return DecodeStatus::ProtocolError;

    if (buf.size() < pos + 4)
        return DecodeStatus::NeedMore;
    const char *mask = buf.data() + pos;
    pos += 4;

    if (buf.size() < pos + len)
        return DecodeStatus::NeedMore;

    out.opcode = static_cast<Opcode>(b0 & 0x0F);
    out.fin = (b0 & 0x80) != 0;
    out.payload.resize(static_cast<std::size_t>(len));
    for (std::size_t i = 0; i < len; ++i)
        out.payload[i] = static_cast<char>(buf[pos + i] ^ mask[i % 4]);

    consumed = pos + static_cast<std::size_t>(len);
    return DecodeStatus::Frame;
}

} // namespace mudcast::transport::ws
