#include <mudcast/bus/SubjectPattern.hpp>

namespace mudcast::bus
{
namespace
{
// s 에서 다음 토큰을 잘라내고 s 를 전진시킨다. 마지막 토큰이면 s 는 비고 last=true.
std::string_view nextToken(std::string_view &s, bool &last) noexcept
{
    const auto dot = s.find('.');
    if (dot == std::string_view::npos)
    {
        auto tok = s;
        s = {};
        last = true;
        return tok;
    }
    auto tok = s.substr(0, dot);
    s.remove_prefix(dot + 1);
    last = false;
    return tok;
}

bool hasForbiddenChar(std::string_view tok) noexcept
{
    for (char c : tok)
    {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            return true;
    }
    return false;
}
} // namespace

bool isValidSubject(std::string_view subject) noexcept
{
    if (subject.empty())
        return false;

    bool last = false;
    while (!last)
    {
        auto tok = nextToken(subject, last);
        if (tok.empty() || hasForbiddenChar(tok) || tok == "*" || tok == ">")
            return false;
    }
    return true;
}

bool isValidPattern(std::string_view pattern) noexcept
{
    if (pattern.empty())
        return false;

    bool last = false;
    while (!last)
    {
        auto tok = nextToken(pattern, last);
        if (tok.empty() || hasForbiddenChar(tok))
            return false;
        if (tok == ">" && !last)
            return false;
    }
    return true;
}

bool subjectMatches(std::string_view pattern, std::string_view subject) noexcept
{
    if (pattern.empty() || subject.empty())
        return false;

    bool patLast = false;
    bool subLast = false;
    for (;;)
    {
        const auto p = nextToken(pattern, patLast);
        const auto s = nextToken(subject, subLast);

        if (p == ">")
            return patLast && !s.empty();
        if (p != "*" && p != s)
            return false;

        if (patLast || subLast)
            return patLast && subLast;
    }
}

} // namespace mudcast::bus
