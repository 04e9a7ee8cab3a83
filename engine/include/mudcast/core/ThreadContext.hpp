#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <sys/syscall.h>
#include <unistd.h>

namespace mudcast::core
{

/// 로그 라인의 thread 컬럼 ("main", "bus", "nats-rx", "log")
///
/// 역할 스레드는 진입점에서 setCurrentRole() 을 1회 부른다. 부르지 않은 스레드는 "main".
class ThreadContext
{
  public:
    static constexpr std::size_t kMaxRoleLength = 15;

    static void setCurrentRole(std::string_view role)
    {
        roleSlot() = std::string(role.substr(0, kMaxRoleLength));
    }

    [[nodiscard]] static std::string_view currentRole() noexcept
    {
        const std::string &role = roleSlot();
        return role.empty() ? std::string_view{"main"} : std::string_view{role};
    }

    // gettid 는 스레드당 1회만
    [[nodiscard]] static long currentTid() noexcept
    {
        thread_local const long cached = static_cast<long>(::syscall(SYS_gettid));
        return cached;
    }

  private:
    static std::string &roleSlot() noexcept
    {
        thread_local std::string role;
        return role;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}

[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentRole();
}

} // namespace mudcast::core
