#pragma once

#include <mudcast/util/NonCopyable.hpp>

#include <array>
#include <csignal>
#include <string_view>

#include <signal.h>

namespace mudcast::core
{

/// 노드 프로세스의 종료 신호 감시.
///
/// - SIGINT/SIGTERM 은 플래그만 올린다. 노드 루프가 stopRequested()를 폴링해 정상 종료로 들어간다.
/// - SIGPIPE 는 무시한다. (끊긴 소켓 쓰기는 EPIPE 로 처리)
/// - 프로세스 전역 상태이므로 인스턴스는 하나만 둔다. 소멸 시 이전 핸들러로 복구
class SignalHandler : private mudcast::util::NonCopyable
{
  public:
    /// @throws std::system_error sigaction 실패
    SignalHandler();
    ~SignalHandler() noexcept;

    SignalHandler(SignalHandler &&) = delete;
    SignalHandler &operator=(SignalHandler &&) = delete;

    [[nodiscard]] bool stopRequested() const noexcept;

    /// 마지막으로 받은 신호 번호 (없으면 0)
    [[nodiscard]] int lastSignal() const noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void onSignal(int signo) noexcept;

    static constexpr std::array<int, 3> kSignals = {SIGINT, SIGTERM, SIGPIPE};

    std::array<struct sigaction, kSignals.size()> previous_{};
    std::size_t installed_{0};

    void restore() noexcept;
};

} // namespace mudcast::core
