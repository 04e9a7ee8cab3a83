#include <mudcast/bus/CircuitBreaker.hpp>
#include <mudcast/bus/RetryPolicy.hpp>
#include <mudcast/core/Clock.hpp>

#include <chrono>
#include <iostream>

using mudcast::bus::CircuitBreaker;
using mudcast::bus::CircuitState;
using mudcast::bus::RetryPolicy;
using mudcast::core::ManualClock;

namespace {

/// 1s, 2s, 4s ... 로 늘다가 maxDelay 에서 멈춥니다.
bool test_backoff_doubles_and_caps() {
    using namespace std::chrono_literals;

    RetryPolicy p;
    p.maxAttempts = 10;
    p.baseDelay = 1000ms;
    p.maxDelay = 5000ms;

    if (p.delayAfter(1) != 1000ms || p.delayAfter(2) != 2000ms || p.delayAfter(3) != 4000ms) {
        std::cerr << "[backoff] doubling mismatch\n";
        return false;
    }
    if (p.delayAfter(4) != 5000ms || p.delayAfter(60) != 5000ms) {
        std::cerr << "[backoff] cap not applied\n";
        return false;
    }
    return true;
}

bool test_should_retry_counts_total_attempts() {
    RetryPolicy p;
    p.maxAttempts = 3;
    if (!p.shouldRetry(1) || !p.shouldRetry(2) || p.shouldRetry(3)) {
        std::cerr << "[retry] shouldRetry boundary mismatch\n";
        return false;
    }
    return true;
}

/// Closed -> (연속 실패 threshold) -> Open -> (timeout) -> HalfOpen -> (성공 N회) -> Closed
bool test_breaker_full_cycle() {
    using namespace std::chrono_literals;

    ManualClock clock;
    CircuitBreaker cb(clock, CircuitBreaker::Options{3, 60000ms, 2});

    if (!cb.allowRequest() || cb.onFailure() || cb.onFailure()) {
        std::cerr << "[cycle] opened before threshold\n";
        return false;
    }
    if (!cb.onFailure() || cb.state() != CircuitState::Open) {
        std::cerr << "[cycle] did not open at threshold\n";
        return false;
    }

    clock.advance(59s);
    if (cb.allowRequest()) {
        std::cerr << "[cycle] allowed while open\n";
        return false;
    }

    clock.advance(1s);
    if (!cb.allowRequest() || cb.state() != CircuitState::HalfOpen) {
        std::cerr << "[cycle] no half-open after timeout\n";
        return false;
    }

    cb.onSuccess();
    if (cb.state() != CircuitState::HalfOpen) {
        std::cerr << "[cycle] closed after a single success\n";
        return false;
    }
    cb.onSuccess();
    if (cb.state() != CircuitState::Closed) {
        std::cerr << "[cycle] not closed after success threshold\n";
        return false;
    }
    return true;
}

bool test_half_open_failure_reopens() {
    using namespace std::chrono_literals;

    ManualClock clock;
    CircuitBreaker cb(clock, CircuitBreaker::Options{1, 1000ms, 2});

    (void)cb.onFailure();
    clock.advance(1s);
    (void)cb.allowRequest();

    if (!cb.onFailure() || cb.state() != CircuitState::Open || cb.allowRequest()) {
        std::cerr << "[half-open] failure did not reopen\n";
        return false;
    }
    return true;
}

/// Closed 에서 성공은 연속 실패 카운트를 리셋합니다.
bool test_success_resets_failures() {
    using namespace std::chrono_literals;

    ManualClock clock;
    CircuitBreaker cb(clock, CircuitBreaker::Options{2, 1000ms, 1});

    (void)cb.onFailure();
    cb.onSuccess();
    if (cb.onFailure() || cb.state() != CircuitState::Closed) {
        std::cerr << "[reset] failures not reset by success\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_backoff_doubles_and_caps();
    ok = ok && test_should_retry_counts_total_attempts();
    ok = ok && test_breaker_full_cycle();
    ok = ok && test_half_open_failure_reopens();
    ok = ok && test_success_resets_failures();

    if (!ok) {
        std::cerr << "RetryBreaker tests FAILED\n";
        return 1;
    }

    std::cout << "RetryBreaker tests PASSED\n";
    return 0;
}
