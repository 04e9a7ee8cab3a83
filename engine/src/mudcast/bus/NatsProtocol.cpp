#include <mudcast/bus/NatsProtocol.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <stdexcept>
#include <vector>

namespace mudcast::bus::nats
{
namespace
{
constexpr std::string_view kCrlf = "\r\n";

std::vector<std::string_view> splitSpaces(std::string_view s)
{
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (pos < s.size())
    {
        while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t'))
            ++pos;
        if (pos >= s.size())
            break;
        const auto end = s.find_first_of(" \t", pos);
        const auto stop = (end == std::string_view::npos) ? s.size() : end;
        out.push_back(s.substr(pos, stop - pos));
        pos = stop;
    }
    return out;
}

bool parseUInt(std::string_view s, std::uint64_t &out) noexcept
{
    const auto *first = s.data();
    const auto *last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool startsWithOp(std::string_view line, std::string_view op) noexcept
{
    return line.size() >= op.size() && line.substr(0, op.size()) == op &&
           (line.size() == op.size() || line[op.size()] == ' ' || line[op.size()] == '\t');
}

std::string_view afterOp(std::string_view line, std::string_view op) noexcept
{
    return line.size() > op.size() ? line.substr(op.size() + 1) : std::string_view{};
}
} // namespace

std::string encodeConnect(const ConnectOptions &opt)
{
    nlohmann::json j = {
        {"verbose", opt.verbose}, {"pedantic", opt.pedantic}, {"name", opt.name},
        {"lang", "cpp"},          {"version", "1.0.0"},       {"protocol", 1},
    };
    if (opt.user)
        j["user"] = *opt.user;
    if (opt.password)
        j["pass"] = *opt.password;
    if (opt.token)
        j["auth_token"] = *opt.token;

    return fmt::format("CONNECT {}\r\n", j.dump());
}

std::string encodePub(std::string_view subject, std::string_view payload)
{
    std::string out = fmt::format("PUB {} {}\r\n", subject, payload.size());
    out.append(payload.data(), payload.size());
    out.append(kCrlf);
    return out;
}

std::string encodeSub(std::string_view subject, std::uint64_t sid)
{
    return fmt::format("SUB {} {}\r\n", subject, sid);
}

std::string encodeUnsub(std::uint64_t sid)
{
    return fmt::format("UNSUB {}\r\n", sid);
}

bool Parser::next(ServerOp &out)
{
    const auto eol = buf_.find(kCrlf);
    if (eol == std::string::npos)
        return false;

    const std::string_view line(buf_.data(), eol);
    const std::size_t headerLen = eol + kCrlf.size();

    if (startsWithOp(line, "MSG"))
    {
        // MSG <subject> <sid> [reply-to] <#bytes>
        const auto parts = splitSpaces(afterOp(line, "MSG"));
        if (parts.size() < 3 || parts.size() > 4)
            throw std::runtime_error("nats: malformed MSG header");

        std::uint64_t sid = 0;
        std::uint64_t n = 0;
        if (!parseUInt(parts[1], sid) || !parseUInt(parts.back(), n))
            throw std::runtime_error("nats: malformed MSG header numbers");

        const std::size_t total = headerLen + static_cast<std::size_t>(n) + kCrlf.size();
        if (buf_.size() < total)
            return false; // payload 대기

        out.kind = ServerOp::Kind::Msg;
        out.subject.assign(parts[0].data(), parts[0].size());
        out.sid = sid;
        out.payload.assign(buf_, headerLen, static_cast<std::size_t>(n));
        buf_.erase(0, total);
        return true;
    }

    if (line == "PING")
        out.kind = ServerOp::Kind::Ping;
    else if (line == "PONG")
        out.kind = ServerOp::Kind::Pong;
    else if (line == "+OK")
        out.kind = ServerOp::Kind::Ok;
    else if (startsWithOp(line, "-ERR"))
    {
        out.kind = ServerOp::Kind::Err;
        out.payload.assign(afterOp(line, "-ERR"));
    }
    else if (startsWithOp(line, "INFO"))
    {
        out.kind = ServerOp::Kind::Info;
        out.payload.assign(afterOp(line, "INFO"));
    }
    else
        throw std::runtime_error("nats: unknown protocol op");

    if (out.kind != ServerOp::Kind::Err && out.kind != ServerOp::Kind::Info)
        out.payload.clear();
    out.subject.clear();
    out.sid = 0;
    buf_.erase(0, headerLen);
    return true;
}

} // namespace mudcast::bus::nats
