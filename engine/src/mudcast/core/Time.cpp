#include <mudcast/core/Time.hpp>

#include <fmt/format.h>

#include <ctime>

namespace mudcast::core
{

std::string formatIso8601Utc(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    const auto t = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % seconds(1);
    if (ms.count() < 0)
        ms += seconds(1);

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                       static_cast<int>(ms.count()));
}

} // namespace mudcast::core
