#include <mudcast/core/BoundedTaskQueue.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using mudcast::core::BoundedTaskQueue;

namespace {

bool test_fifo_order() {
    BoundedTaskQueue q(8);

    std::vector<int> seen;
    for (int i = 0; i < 3; ++i)
        (void)q.push([&seen, i]() { seen.push_back(i); });

    BoundedTaskQueue::Task t;
    while (q.tryPop(t))
        t();

    if (seen != std::vector<int>{0, 1, 2}) {
        std::cerr << "[fifo] order mismatch\n";
        return false;
    }
    return true;
}

/// 가득 찬 큐에 push 하면 가장 오래된 작업이 버려집니다.
bool test_drop_oldest() {
    BoundedTaskQueue q(2);

    std::vector<int> seen;
    (void)q.push([&]() { seen.push_back(1); });
    (void)q.push([&]() { seen.push_back(2); });
    const auto r = q.push([&]() { seen.push_back(3); });

    if (r != BoundedTaskQueue::PushResult::DroppedOldest) {
        std::cerr << "[drop] expected DroppedOldest\n";
        return false;
    }
    if (q.size() != 2 || q.droppedTotal() != 1) {
        std::cerr << "[drop] size=" << q.size() << " dropped=" << q.droppedTotal() << "\n";
        return false;
    }

    BoundedTaskQueue::Task t;
    while (q.tryPop(t))
        t();

    if (seen != std::vector<int>{2, 3}) {
        std::cerr << "[drop] wrong survivors\n";
        return false;
    }
    return true;
}

bool test_zero_capacity_rejected() {
    try {
        BoundedTaskQueue q(0);
        std::cerr << "[zero] capacity 0 accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
        return true;
    }
}

/// 여러 producer 가 동시에 push 해도 accepted + dropped == 총 push 수입니다.
bool test_concurrent_producers() {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;

    BoundedTaskQueue q(256);
    std::atomic<int> ran{0};

    std::vector<std::thread> producers;
    for (int i = 0; i < kThreads; ++i) {
        producers.emplace_back([&]() {
            for (int j = 0; j < kPerThread; ++j)
                (void)q.push([&ran]() { ran.fetch_add(1, std::memory_order_relaxed); });
        });
    }
    for (auto &th : producers)
        th.join();

    BoundedTaskQueue::Task t;
    while (q.tryPop(t))
        t();

    const auto total = static_cast<std::uint64_t>(ran.load()) + q.droppedTotal();
    if (total != static_cast<std::uint64_t>(kThreads * kPerThread)) {
        std::cerr << "[mpsc] ran=" << ran.load() << " dropped=" << q.droppedTotal() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_fifo_order();
    ok = ok && test_drop_oldest();
    ok = ok && test_zero_capacity_rejected();
    ok = ok && test_concurrent_producers();

    if (!ok) {
        std::cerr << "BoundedTaskQueue tests FAILED\n";
        return 1;
    }

    std::cout << "BoundedTaskQueue tests PASSED\n";
    return 0;
}
