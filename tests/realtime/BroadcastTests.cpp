#include "RealtimeFakes.hpp"

#include <realtime/broadcast/BroadcastCoordinator.hpp>
#include <realtime/broadcast/ChannelStrategies.hpp>
#include <realtime/broadcast/ChannelStrategyFactory.hpp>
#include <realtime/broadcast/RoomSubscriptionManager.hpp>
#include <realtime/inbound/ChatBroadcastSink.hpp>
#include <realtime/protocol/Subjects.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>
#include <realtime/registry/IMuteLookup.hpp>

#include <mudcast/core/Clock.hpp>
#include <mudcast/core/Logger.hpp>
#include <mudcast/core/MemoryLogger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace realtime::broadcast;
using realtime::protocol::Envelope;
using realtime::protocol::makeEnvelope;
using realtime::registry::ConnectionRegistry;
using realtime::registry::InMemoryMuteList;
using realtime::registry::RegistryOptions;
using realtime::testing::FakeTransport;
using realtime::testing::RecordingPublisher;
using realtime::testing::RecordingSubscriber;

namespace {

/// 한 프로세스 분량의 broadcast 파이프라인 (bus 는 기록만)
struct Node {
    mudcast::core::ManualClock clock;
    ConnectionRegistry registry{clock, RegistryOptions{}, realtime::payload::PayloadOptimizer{}};
    std::shared_ptr<InMemoryMuteList> mutes = std::make_shared<InMemoryMuteList>();
    ChannelStrategyFactory factory{registry, mutes};
    RecordingPublisher bus;
    BroadcastCoordinator coordinator;

    explicit Node(std::string processId = "node-a") : coordinator(std::move(processId), factory, bus) {}

    std::shared_ptr<FakeTransport> join(const std::string &player, const std::string &room = {}) {
        auto t = std::make_shared<FakeTransport>();
        registry.registerConnection(player, t);
        if (!room.empty())
            registry.setPlayerRoom(player, room);
        return t;
    }
};

Envelope chat(const std::string &channel) {
    return makeEnvelope("chat_message", {{"content", "hi"}}, channel);
}

RoutingArgs from(const std::string &sender) {
    RoutingArgs r;
    r.senderId = sender;
    return r;
}

bool test_factory_known_and_unknown_channels() {
    Node n;
    const char *known[] = {"say", "local", "emote", "pose", "global", "party", "whisper", "system", "admin"};
    for (auto name : known) {
        if (n.factory.getStrategy(name)->channelType() != name) {
            std::cerr << "[factory] strategy mismatch for " << name << "\n";
            return false;
        }
    }
    if (n.factory.getStrategy("shout")->channelType() != "shout" || n.factory.registeredChannels().size() != 9) {
        std::cerr << "[factory] unknown channel handling mismatch\n";
        return false;
    }

    try {
        n.factory.registerStrategy("", std::make_shared<PartyStrategy>());
        std::cerr << "[factory] empty name accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }

    n.factory.registerStrategy("shout", std::make_shared<GlobalStrategy>(n.registry));
    if (n.factory.getStrategy("shout")->channelType() != "global") {
        std::cerr << "[factory] registerStrategy did not replace\n";
        return false;
    }
    return true;
}

/// P1, P2 가 R1 에 있고 P1 이 say: P2 만 받고 room.R1 로 정확히 1회 발행
bool test_room_say_reaches_others_and_publishes_once() {
    Node n;
    auto p1 = n.join("P1", "R1");
    auto p2 = n.join("P2", "R1");
    auto p3 = n.join("P3", "R9");

    RoutingArgs r = from("P1");
    r.roomId = "R1";
    const auto out = n.coordinator.publish(chat("say"), r);

    if (out.status != BroadcastStatus::Delivered || out.delivered != 1 || !out.published) {
        std::cerr << "[room] outcome mismatch delivered=" << out.delivered << "\n";
        return false;
    }
    if (!p1->sent.empty() || p2->sent.size() != 1 || !p3->sent.empty()) {
        std::cerr << "[room] wrong recipients\n";
        return false;
    }
    if (n.bus.published.size() != 1 || n.bus.countOn("room.R1") != 1) {
        std::cerr << "[room] expected one publish on room.R1\n";
        return false;
    }

    const auto wire = nlohmann::json::parse(n.bus.published[0].second);
    if (wire["origin"] != "node-a" || wire["room_id"] != "R1" || wire["sender_id"] != "P1" || wire["sequence_number"] != 1) {
        std::cerr << "[room] bus payload mismatch: " << n.bus.published[0].second << "\n";
        return false;
    }

    const auto client = nlohmann::json::parse(p2->sent[0].second);
    if (client["player_id"] != "P1" || client.contains("origin")) {
        std::cerr << "[room] client frame mismatch\n";
        return false;
    }
    return true;
}

bool test_room_without_room_id_is_noop() {
    Node n;
    auto p1 = n.join("P1", "R1");
    auto p2 = n.join("P2", "R1");

    mudcast::monitoring::deliveryMetrics().reset();
    const auto out = n.coordinator.publish(chat("say"), from("P1"));

    if (out.status != BroadcastStatus::Skipped || !p1->sent.empty() || !p2->sent.empty() || !n.bus.published.empty()) {
        std::cerr << "[noroom] missing room_id must not touch registry or bus\n";
        return false;
    }
    if (mudcast::monitoring::deliveryMetrics().snapshot().routingSkippedTotal != 1) {
        std::cerr << "[noroom] skip not counted\n";
        return false;
    }
    return true;
}

bool test_room_respects_mutes() {
    Node n;
    n.join("P1", "R1");
    auto p2 = n.join("P2", "R1");
    auto p3 = n.join("P3", "R1");
    n.mutes->mute("P2", "P1", "say");
    n.mutes->mute("P3", "P1", "emote");

    RoutingArgs r = from("P1");
    r.roomId = "R1";
    n.coordinator.publish(chat("say"), r);

    if (!p2->sent.empty() || p3->sent.size() != 1) {
        std::cerr << "[mute] channel-scoped mute not honored\n";
        return false;
    }

    n.mutes->mute("P3", "P1");
    n.coordinator.publish(chat("say"), r);
    if (p3->sent.size() != 1) {
        std::cerr << "[mute] wildcard mute not honored\n";
        return false;
    }
    return true;
}

bool test_global_and_system_channels() {
    Node n;
    auto p1 = n.join("P1");
    auto p2 = n.join("P2");
    auto logger = std::make_shared<mudcast::core::MemoryLogger>();
    mudcast::core::setLogger(logger);

    const auto g = n.coordinator.publish(chat("global"), from("P1"));
    const auto s = n.coordinator.publish(chat("system"), from("P1"));
    const auto a = n.coordinator.publish(chat("admin"), RoutingArgs{});

    mudcast::core::setLogger(nullptr);

    if (g.delivered != 1) {
        std::cerr << "[global] delivery mismatch\n";
        return false;
    }
    if (s.delivered != 1 || a.delivered != 2 || p2->sent.size() != 3 || p1->sent.size() != 1) {
        std::cerr << "[system] delivery mismatch p1=" << p1->sent.size() << " p2=" << p2->sent.size() << "\n";
        return false;
    }
    if (n.bus.countOn("global") != 1 || n.bus.countOn("system") != 2) {
        std::cerr << "[system] publish subjects mismatch\n";
        return false;
    }
    if (logger->count("WARN | Broadcast | SystemAudit") != 2) {
        std::cerr << "[system] audit log missing\n";
        return false;
    }
    return true;
}

bool test_whisper_delivers_once_without_publish() {
    Node n;
    auto p1 = n.join("P1");
    auto p2 = n.join("P2");
    auto p3 = n.join("P3");

    RoutingArgs r = from("P1");
    r.targetPlayerId = "P2";
    const auto out = n.coordinator.publish(chat("whisper"), r);

    if (out.delivered != 1 || out.published || p2->sent.size() != 1 || !p1->sent.empty() || !p3->sent.empty() || !n.bus.published.empty()) {
        std::cerr << "[whisper] expected exactly one local delivery\n";
        return false;
    }

    r.targetPlayerId = "elsewhere";
    const auto remote = n.coordinator.publish(chat("whisper"), r);
    if (remote.status != BroadcastStatus::Delivered || remote.delivered != 0 || !n.bus.published.empty()) {
        std::cerr << "[whisper] non-local target must not relay\n";
        return false;
    }

    r.targetPlayerId.reset();
    if (n.coordinator.publish(chat("whisper"), r).status != BroadcastStatus::Skipped) {
        std::cerr << "[whisper] missing target not skipped\n";
        return false;
    }
    return true;
}

bool test_party_and_unknown_channels() {
    Node n;
    auto p1 = n.join("P1");
    auto p2 = n.join("P2");

    RoutingArgs r = from("P1");
    r.partyId = "party-1";
    const auto party = n.coordinator.publish(chat("party"), r);
    const auto unknown = n.coordinator.publish(chat("shout"), from("P1"));

    if (party.status != BroadcastStatus::NotImplemented || unknown.status != BroadcastStatus::Skipped) {
        std::cerr << "[party] status mismatch\n";
        return false;
    }
    if (!p1->sent.empty() || !p2->sent.empty() || !n.bus.published.empty()) {
        std::cerr << "[party] nothing should be delivered\n";
        return false;
    }
    return true;
}

bool test_sequence_numbers_per_sender() {
    Node n;
    n.join("P1");
    n.coordinator.publish(chat("global"), from("P1"));
    n.coordinator.publish(chat("global"), from("P1"));
    n.coordinator.publish(chat("global"), from("P2"));

    if (n.coordinator.sequences().current("P1") != 2 || n.coordinator.sequences().current("P2") != 1) {
        std::cerr << "[seq] per-sender sequence mismatch\n";
        return false;
    }
    const auto last = nlohmann::json::parse(n.bus.published.back().second);
    if (last["sequence_number"] != 1 || last["sender_id"] != "P2") {
        std::cerr << "[seq] wire sequence mismatch\n";
        return false;
    }

    // 떠난 플레이어의 카운터는 버려지고, 다시 들어오면 1부터
    n.coordinator.forgetSender("P1");
    n.coordinator.publish(chat("global"), from("P1"));
    if (n.coordinator.sequences().size() != 2 || n.coordinator.sequences().current("P1") != 1) {
        std::cerr << "[seq] forgotten sender did not restart at 1\n";
        return false;
    }
    return true;
}

/// 두 노드: A 가 발행한 bus payload 를 B 가 받으면 로컬 전달, A 자신은 버린다.
bool test_remote_delivery_and_own_echo() {
    Node a("node-a");
    Node b("node-b");
    auto localA = a.join("P2", "R1");
    auto remoteB = b.join("P7", "R1");
    a.join("P1", "R1");

    RoutingArgs r = from("P1");
    r.roomId = "R1";
    a.coordinator.publish(chat("say"), r);
    if (a.bus.published.size() != 1) {
        std::cerr << "[remote] nothing published\n";
        return false;
    }
    const auto &[subject, payload] = a.bus.published[0];

    const auto echo = a.coordinator.deliverRemote(subject, payload);
    if (echo.status != BroadcastStatus::Skipped || localA->sent.size() != 1) {
        std::cerr << "[remote] own echo was delivered again\n";
        return false;
    }

    const auto got = b.coordinator.deliverRemote(subject, payload);
    if (got.delivered != 1 || remoteB->sent.size() != 1 || !b.bus.published.empty()) {
        std::cerr << "[remote] remote delivery mismatch\n";
        return false;
    }

    if (b.coordinator.deliverRemote(subject, "{not json").status != BroadcastStatus::Skipped ||
        b.coordinator.deliverRemote(subject, "{\"data\":{}}").status != BroadcastStatus::Skipped) {
        std::cerr << "[remote] malformed payload not skipped\n";
        return false;
    }
    return true;
}

bool test_room_subscription_refcount() {
    Node n;
    RecordingSubscriber subs;
    RoomSubscriptionManager mgr(subs, n.coordinator);
    n.registry.setOccupancyListener([&](const realtime::registry::OccupancyChange &c) { mgr.onOccupancyChange(c); });

    mgr.start();
    mgr.start();
    if (!subs.has("global") || !subs.has("system") || subs.subscribeCalls != 2) {
        std::cerr << "[subs] reserved subjects not subscribed once\n";
        return false;
    }

    const std::string subject = realtime::protocol::roomSubject("earth_arkham_campus_room_101");
    auto p1 = n.join("P1", "earth_arkham_campus_room_101");
    n.join("P2", "earth_arkham_campus_room_102"); // 같은 sub-zone
    if (subject != "room.arkham.campus" || mgr.refCount(subject) != 2 || subs.subscribeCalls != 3) {
        std::cerr << "[subs] shared sub-zone should subscribe once\n";
        return false;
    }

    // 원격 이벤트가 구독 콜백을 통해 로컬로 전달된다.
    Node other("node-b");
    other.join("P9", "earth_arkham_campus_room_101");
    RoutingArgs r = from("P9");
    r.roomId = "earth_arkham_campus_room_101";
    other.coordinator.publish(chat("say"), r);
    if (!subs.deliver(subject, other.bus.published.at(0).second) || p1->sent.size() != 1) {
        std::cerr << "[subs] remote event not routed through subscription\n";
        return false;
    }

    n.registry.setPlayerRoom("P1", "");
    if (mgr.refCount(subject) != 1 || !subs.has(subject)) {
        std::cerr << "[subs] unsubscribed while occupied\n";
        return false;
    }
    n.registry.setPlayerRoom("P2", "");
    if (mgr.refCount(subject) != 0 || subs.has(subject) || subs.unsubscribeCalls != 1) {
        std::cerr << "[subs] last leave did not unsubscribe\n";
        return false;
    }

    mgr.onOccupancyChange({"P5", "", true});
    mgr.onOccupancyChange({"P5", "zz_unknown_room", false});
    if (mgr.activeSubjects().size() != 2) {
        std::cerr << "[subs] edge events changed subscriptions\n";
        return false;
    }

    mgr.stop();
    if (!subs.callbacks.empty() || !mgr.activeSubjects().empty()) {
        std::cerr << "[subs] stop left subscriptions\n";
        return false;
    }
    return true;
}

bool test_chat_sink_routes_by_sender_room() {
    Node n;
    n.join("P1", "R1");
    auto p2 = n.join("P2", "R1");
    realtime::inbound::ChatBroadcastSink sink(n.coordinator, n.registry);

    sink.onChat({"P1", "emote", "waves", std::nullopt});
    sink.onChat({"P1", "whisper", "psst", std::string("P2")});

    if (p2->sent.size() != 2 || n.bus.countOn("room.R1") != 1) {
        std::cerr << "[sink] routing mismatch\n";
        return false;
    }
    const auto first = nlohmann::json::parse(p2->sent[0].second);
    const auto second = nlohmann::json::parse(p2->sent[1].second);
    if (first["data"]["message"] != "P1 waves" || second["data"]["message"] != "P1 whispers: psst" || second["data"]["target_id"] != "P2") {
        std::cerr << "[sink] chat data mismatch: " << p2->sent[1].second << "\n";
        return false;
    }
    return true;
}

/// 게임 로직이 깨진 UTF-8 을 넣어도 publish 는 던지지 않고 U+FFFD 로 치환해 전달/발행합니다.
bool test_invalid_utf8_is_replaced_not_thrown() {
    Node n;
    n.join("P1", "R1");
    auto p2 = n.join("P2", "R1");

    RoutingArgs r = from("P1");
    r.roomId = "R1";
    BroadcastOutcome out;
    try {
        out = n.coordinator.publish(makeEnvelope("chat_message", {{"content", std::string("bad\xff")}}, "say"), r);
    } catch (const std::exception &e) {
        std::cerr << "[utf8] publish threw: " << e.what() << "\n";
        return false;
    }

    if (out.delivered != 1 || !out.published || p2->sent.size() != 1 || n.bus.countOn("room.R1") != 1) {
        std::cerr << "[utf8] delivery or publish skipped\n";
        return false;
    }

    const auto client = nlohmann::json::parse(p2->sent[0].second);
    const auto wire = nlohmann::json::parse(n.bus.published[0].second);
    if (client["data"]["content"] != "bad\xEF\xBF\xBD" || wire["data"]["content"] != "bad\xEF\xBF\xBD") {
        std::cerr << "[utf8] replacement character missing\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_factory_known_and_unknown_channels();
    ok &= test_room_say_reaches_others_and_publishes_once();
    ok &= test_room_without_room_id_is_noop();
    ok &= test_room_respects_mutes();
    ok &= test_global_and_system_channels();
    ok &= test_whisper_delivers_once_without_publish();
    ok &= test_party_and_unknown_channels();
    ok &= test_sequence_numbers_per_sender();
    ok &= test_remote_delivery_and_own_echo();
    ok &= test_room_subscription_refcount();
    ok &= test_chat_sink_routes_by_sender_room();
    ok &= test_invalid_utf8_is_replaced_not_thrown();

    if (!ok) {
        std::cerr << "Broadcast tests FAILED\n";
        return 1;
    }
    std::cout << "Broadcast tests PASSED\n";
    return 0;
}
