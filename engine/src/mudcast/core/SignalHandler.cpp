#include <mudcast/core/SignalHandler.hpp>

#include <cerrno>
#include <system_error>

namespace mudcast::core {

namespace {
// handler 안에서는 sig_atomic_t 쓰기만 한다.
volatile std::sig_atomic_t g_stop = 0;
volatile std::sig_atomic_t g_signal = 0;
} // namespace

SignalHandler::SignalHandler() {
    g_stop = 0;
    g_signal = 0;

    for (std::size_t i = 0; i < kSignals.size(); ++i) {
        struct sigaction sa{};
        ::sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0; // SA_RESTART 없음: 대기 중인 poll/sleep 이 EINTR 로 깨어난다.
        sa.sa_handler = kSignals[i] == SIGPIPE ? SIG_IGN : &SignalHandler::onSignal;

        if (::sigaction(kSignals[i], &sa, &previous_[i]) != 0) {
            const int err = errno;
            restore();
            throw std::system_error(err, std::generic_category(), "SignalHandler: sigaction failed");
        }
        installed_ = i + 1;
    }
}

SignalHandler::~SignalHandler() noexcept { restore(); }

void SignalHandler::restore() noexcept {
    while (installed_ > 0) {
        --installed_;
        (void)::sigaction(kSignals[installed_], &previous_[installed_], nullptr);
    }
}

void SignalHandler::onSignal(int signo) noexcept {
    g_stop = 1;
    g_signal = signo;
}

bool SignalHandler::stopRequested() const noexcept { return g_stop != 0; }

int SignalHandler::lastSignal() const noexcept { return static_cast<int>(g_signal); }

std::string_view SignalHandler::signalName(int signo) noexcept {
    switch (signo) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    case 0:
        return "none";
    default:
        return "OTHER";
    }
}

} // namespace mudcast::core
