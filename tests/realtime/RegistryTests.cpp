#include "RealtimeFakes.hpp"

#include <realtime/registry/ConnectionRegistry.hpp>

#include <mudcast/core/Clock.hpp>
#include <mudcast/core/Logger.hpp>
#include <mudcast/core/MemoryLogger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

using mudcast::core::ManualClock;
using mudcast::transport::SendResult;
using realtime::registry::ConnectionRegistry;
using realtime::registry::OccupancyChange;
using realtime::registry::RegistryOptions;
using realtime::testing::FakeTransport;

namespace {

using namespace std::chrono_literals;

struct Rig {
    ManualClock clock;
    ConnectionRegistry registry;

    explicit Rig(std::size_t cap = 2, std::chrono::milliseconds stale = 60000ms)
        : registry(clock, RegistryOptions{cap, stale}, realtime::payload::PayloadOptimizer{}) {}
};

realtime::protocol::Envelope hello() {
    return realtime::protocol::makeEnvelope("chat_message", {{"content", "hello"}}, "say");
}

/// 상한을 넘으면 가장 오래된 handle 이 닫히고 밀려난다.
bool test_register_evicts_oldest_over_cap() {
    Rig rig(2);
    auto a = std::make_shared<FakeTransport>();
    auto b = std::make_shared<FakeTransport>();
    auto c = std::make_shared<FakeTransport>();

    rig.registry.registerConnection("P1", a);
    rig.registry.registerConnection("P1", b);
    rig.registry.registerConnection("P1", c);

    if (a->isOpen() || a->closeCalls != 1 || !b->isOpen() || !c->isOpen()) {
        std::cerr << "[evict] oldest handle not closed\n";
        return false;
    }
    if (rig.registry.connectionCount() != 2 || rig.registry.playerCount() != 1) {
        std::cerr << "[evict] counts mismatch\n";
        return false;
    }

    if (rig.registry.sendLocal("P1", hello()) != 2 || !a->sent.empty() || b->sent.size() != 1 || c->sent.size() != 1) {
        std::cerr << "[evict] evicted handle still receives\n";
        return false;
    }
    return true;
}

bool test_register_rejects_bad_input() {
    Rig rig;
    auto closed = std::make_shared<FakeTransport>();
    closed->close();

    if (rig.registry.registerConnection("P1", nullptr) || rig.registry.registerConnection("P1", closed) ||
        rig.registry.registerConnection("", std::make_shared<FakeTransport>())) {
        std::cerr << "[register] accepted invalid connection\n";
        return false;
    }
    if (rig.registry.playerCount() != 0) {
        std::cerr << "[register] rejected input left an entry\n";
        return false;
    }
    return true;
}

/// 쓰기에 실패한 handle 만 제거되고 같은 플레이어의 다른 handle / 다른 수신자는 계속 받는다.
bool test_write_failure_removes_only_that_handle() {
    Rig rig(3);
    auto slow = std::make_shared<FakeTransport>();
    auto fast = std::make_shared<FakeTransport>();
    auto other = std::make_shared<FakeTransport>();
    rig.registry.registerConnection("P1", slow);
    rig.registry.registerConnection("P1", fast);
    rig.registry.registerConnection("P2", other);

    slow->failWith(SendResult::Backpressure);

    mudcast::monitoring::deliveryMetrics().reset();
    const auto report = rig.registry.broadcastLocal(hello());

    if (report.attempted != 3 || report.delivered != 2 || report.failed != 1) {
        std::cerr << "[writefail] report mismatch " << report.attempted << "/" << report.delivered << "/" << report.failed << "\n";
        return false;
    }
    if (slow->isOpen() || !fast->isOpen() || fast->sent.size() != 1 || other->sent.size() != 1) {
        std::cerr << "[writefail] wrong handle affected\n";
        return false;
    }
    if (rig.registry.connectionCount() != 2 || !rig.registry.hasPlayer("P1")) {
        std::cerr << "[writefail] registry state mismatch\n";
        return false;
    }

    const auto snap = mudcast::monitoring::deliveryMetrics().snapshot();
    if (snap.localDeliveriesTotal != 2 || snap.deliveryFailuresTotal != 1) {
        std::cerr << "[writefail] metrics mismatch\n";
        return false;
    }
    return true;
}

bool test_broadcast_excludes_sender_and_send_to_absent() {
    Rig rig;
    auto p1 = std::make_shared<FakeTransport>();
    auto p2 = std::make_shared<FakeTransport>(mudcast::transport::TransportKind::EventStream);
    rig.registry.registerConnection("P1", p1);
    rig.registry.registerConnection("P2", p2);

    const auto report = rig.registry.broadcastLocal(hello(), std::string("P1"));
    if (report.delivered != 1 || !p1->sent.empty() || p2->sent.size() != 1 || p2->sent[0].first != "chat_message") {
        std::cerr << "[exclude] sender was not excluded\n";
        return false;
    }

    const auto frame = nlohmann::json::parse(p2->sent[0].second);
    if (frame["event_type"] != "chat_message" || frame["data"]["content"] != "hello") {
        std::cerr << "[exclude] frame mismatch: " << p2->sent[0].second << "\n";
        return false;
    }

    if (rig.registry.sendLocal("ghost", hello()) != 0) {
        std::cerr << "[exclude] absent player reported deliveries\n";
        return false;
    }
    return true;
}

bool test_room_occupancy_events() {
    Rig rig;
    std::vector<OccupancyChange> events;
    rig.registry.setOccupancyListener([&](const OccupancyChange &c) { events.push_back(c); });

    auto t = std::make_shared<FakeTransport>();
    rig.registry.registerConnection("P1", t);

    if (rig.registry.setPlayerRoom("ghost", "R1")) {
        std::cerr << "[room] unknown player accepted\n";
        return false;
    }

    rig.registry.setPlayerRoom("P1", "R1");
    rig.registry.setPlayerRoom("P1", "R1"); // 같은 방: 이벤트 없음
    rig.registry.setPlayerRoom("P1", "R2");

    if (events.size() != 3 || !events[0].entered || events[0].roomId != "R1" || events[1].entered || events[1].roomId != "R1" ||
        !events[2].entered || events[2].roomId != "R2") {
        std::cerr << "[room] event order mismatch (" << events.size() << ")\n";
        return false;
    }
    if (!rig.registry.roomOccupants("R1").empty() || rig.registry.roomOccupants("R2").count("P1") != 1 || rig.registry.playerRoom("P1") != "R2") {
        std::cerr << "[room] index mismatch\n";
        return false;
    }

    // 마지막 handle 이 빠지면 방에서도 나간다.
    rig.registry.unregisterConnection("P1", t->id());
    if (events.size() != 4 || events[3].entered || events[3].roomId != "R2" || !rig.registry.roomOccupants("R2").empty()) {
        std::cerr << "[room] unregister did not leave the room\n";
        return false;
    }
    return true;
}

bool test_reap_stale_and_closed() {
    Rig rig(2, 1000ms);
    auto idle = std::make_shared<FakeTransport>();
    auto active = std::make_shared<FakeTransport>();
    auto dead = std::make_shared<FakeTransport>();
    rig.registry.registerConnection("P1", idle);
    rig.registry.registerConnection("P2", active);
    rig.registry.registerConnection("P3", dead);

    dead->close();
    if (rig.registry.reapStale(rig.clock.now()) != 1 || rig.registry.hasPlayer("P3")) {
        std::cerr << "[reap] closed transport not reaped\n";
        return false;
    }

    rig.clock.advance(800ms);
    rig.registry.touch("P2", active->id());
    rig.clock.advance(500ms);

    if (rig.registry.reapStale(rig.clock.now()) != 1 || rig.registry.hasPlayer("P1") || !rig.registry.hasPlayer("P2") || idle->isOpen()) {
        std::cerr << "[reap] stale selection mismatch\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    auto logger = std::make_shared<mudcast::core::MemoryLogger>();
    mudcast::core::setLogger(logger);

    bool ok = true;
    ok &= test_register_evicts_oldest_over_cap();
    ok &= test_register_rejects_bad_input();
    ok &= test_write_failure_removes_only_that_handle();
    ok &= test_broadcast_excludes_sender_and_send_to_absent();
    ok &= test_room_occupancy_events();
    ok &= test_reap_stale_and_closed();

    if (ok && logger->count("Registry | EvictOldest") != 1) {
        std::cerr << "[log] eviction not logged\n";
        ok = false;
    }

    mudcast::core::setLogger(nullptr);

    if (!ok) {
        std::cerr << "Registry tests FAILED\n";
        return 1;
    }
    std::cout << "Registry tests PASSED\n";
    return 0;
}
