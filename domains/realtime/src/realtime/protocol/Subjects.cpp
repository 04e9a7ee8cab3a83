#include <realtime/protocol/Subjects.hpp>

#include <vector>

namespace realtime::protocol
{
namespace
{
std::string sanitizeToken(std::string_view token)
{
    std::string out;
    out.reserve(token.size());
    for (char c : token)
    {
        const bool bad = c == '.' || c == '*' || c == '>' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
        out.push_back(bad ? '-' : c);
    }
    return out;
}

std::vector<std::string_view> splitUnderscore(std::string_view s)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        const auto pos = s.find('_', start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}
} // namespace

std::string roomSubject(std::string_view roomId)
{
    if (roomId.empty())
        return {};

    const auto parts = splitUnderscore(roomId);
    if (parts.size() >= 3 && !parts[1].empty() && !parts[2].empty())
        return "room." + sanitizeToken(parts[1]) + "." + sanitizeToken(parts[2]);

    return "room." + sanitizeToken(roomId);
}

} // namespace realtime::protocol
