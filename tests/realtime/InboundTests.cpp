#include "RealtimeFakes.hpp"

#include <realtime/inbound/InboundHandlers.hpp>
#include <realtime/inbound/InboundMessageHandlerFactory.hpp>
#include <realtime/inbound/RateLimiter.hpp>
#include <realtime/payload/PayloadOptimizer.hpp>

#include <mudcast/core/Clock.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace realtime::inbound;
using mudcast::core::ManualClock;
using realtime::testing::FakeTransport;

namespace {

using namespace std::chrono_literals;

struct RecordingCommandSink final : ICommandSink {
    struct Call {
        std::string player;
        std::string command;
        std::vector<std::string> args;
    };
    std::vector<Call> calls;

    void onCommand(const std::string &playerId, const std::string &command, const std::vector<std::string> &args) override {
        calls.push_back({playerId, command, args});
    }
};

struct RecordingChatSink final : IChatSink {
    std::vector<ChatRequest> requests;
    void onChat(const ChatRequest &req) override { requests.push_back(req); }
};

/// 핸들러가 던지는 경우 확인용
struct ThrowingHandler final : IInboundHandler {
    bool tooLarge = false;
    void handle(const InboundContext &, const nlohmann::json &) override {
        if (tooLarge)
            throw realtime::payload::PayloadTooLarge(200000, 60000, 51200);
        throw std::runtime_error("boom");
    }
};

struct Rig {
    RecordingCommandSink commands;
    RecordingChatSink chats;
    InboundMessageHandlerFactory factory;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    InboundContext ctx{"P1", transport};

    explicit Rig(std::shared_ptr<RateLimiter> limiter = nullptr) : factory(std::move(limiter)) {
        factory.registerHandler("command", std::make_shared<CommandHandler>(commands));
        factory.registerHandler("chat", std::make_shared<ChatHandler>(chats));
        factory.registerHandler("ping", std::make_shared<PingHandler>());
    }

    nlohmann::json lastReply() const { return nlohmann::json::parse(transport->sent.back().second); }
};

bool test_unknown_type_yields_single_invalid_command() {
    Rig rig;
    if (rig.factory.handle(rig.ctx, R"({"type":"foo","data":{}})") != HandleResult::UnknownType) {
        std::cerr << "[unknown] result mismatch\n";
        return false;
    }
    if (rig.transport->sent.size() != 1 || !rig.commands.calls.empty() || !rig.chats.requests.empty()) {
        std::cerr << "[unknown] expected exactly one reply and no handler call\n";
        return false;
    }
    const auto r = rig.lastReply();
    if (rig.transport->sent[0].first != "error" || r["data"]["error_type"] != "INVALID_COMMAND" ||
        r["data"]["message"] != "Unknown message type: foo" || r["data"]["details"]["player_id"] != "P1") {
        std::cerr << "[unknown] reply mismatch: " << rig.transport->sent[0].second << "\n";
        return false;
    }
    return true;
}

bool test_malformed_frames() {
    Rig rig;
    struct Case {
        const char *raw;
        const char *message;
    } cases[] = {
        {"{not json", "Invalid JSON format"},
        {"[1,2]", "Message must be a JSON object"},
        {R"({"type":"chat","data":"hello"})", "Message data must be an object"},
    };

    for (const auto &c : cases) {
        const auto before = rig.transport->sent.size();
        if (rig.factory.handle(rig.ctx, c.raw) != HandleResult::Malformed || rig.transport->sent.size() != before + 1) {
            std::cerr << "[malformed] not rejected: " << c.raw << "\n";
            return false;
        }
        const auto r = rig.lastReply();
        if (r["data"]["error_type"] != "INVALID_FORMAT" || r["data"]["message"] != c.message) {
            std::cerr << "[malformed] reply mismatch: " << rig.transport->sent.back().second << "\n";
            return false;
        }
    }
    return rig.chats.requests.empty();
}

bool test_command_and_legacy_alias() {
    Rig rig;
    rig.factory.handle(rig.ctx, R"({"type":"command","data":{"command":"look","args":["north"]}})");
    rig.factory.handle(rig.ctx, R"({"type":"game_command","data":{"command":"say","args":["hi","all"]}})");

    if (rig.commands.calls.size() != 2 || rig.commands.calls[0].command != "look" || rig.commands.calls[0].args != std::vector<std::string>{"north"} ||
        rig.commands.calls[1].command != "say" || rig.commands.calls[1].args.size() != 2 || rig.commands.calls[1].player != "P1") {
        std::cerr << "[command] dispatch mismatch\n";
        return false;
    }
    if (!rig.factory.hasHandler("game_command") || !rig.transport->sent.empty()) {
        std::cerr << "[command] alias lookup or unexpected reply\n";
        return false;
    }

    rig.factory.handle(rig.ctx, R"({"type":"command","data":{"command":""}})");
    rig.factory.handle(rig.ctx, R"({"type":"command","data":{"command":"go","args":[1]}})");
    if (rig.commands.calls.size() != 2 || rig.transport->sent.size() != 2 || rig.lastReply()["data"]["error_type"] != "INVALID_FORMAT") {
        std::cerr << "[command] invalid command data accepted\n";
        return false;
    }
    return true;
}

bool test_chat_defaults_and_ping() {
    Rig rig;
    rig.factory.handle(rig.ctx, R"({"type":"chat","data":{"message":"hello"}})");
    rig.factory.handle(rig.ctx, R"({"type":"chat","data":{"message":"psst","channel":"whisper","target":"P2"}})");

    if (rig.chats.requests.size() != 2 || rig.chats.requests[0].channel != "say" || rig.chats.requests[0].target.has_value() ||
        rig.chats.requests[1].channel != "whisper" || rig.chats.requests[1].target != "P2") {
        std::cerr << "[chat] request mismatch\n";
        return false;
    }

    if (rig.factory.handle(rig.ctx, R"({"type":"ping"})") != HandleResult::Dispatched || rig.transport->sent.size() != 1 ||
        rig.transport->sent[0].first != "pong") {
        std::cerr << "[ping] no pong reply\n";
        return false;
    }
    return true;
}

bool test_rate_limit_per_connection() {
    ManualClock clock;
    auto limiter = std::make_shared<RateLimiter>(clock, 2, 60000ms);
    Rig rig(limiter);

    auto other = std::make_shared<FakeTransport>();
    InboundContext otherCtx{"P1", other};

    const char *ping = R"({"type":"ping"})";
    rig.factory.handle(rig.ctx, ping);
    rig.factory.handle(rig.ctx, ping);
    if (rig.factory.handle(rig.ctx, ping) != HandleResult::RateLimited) {
        std::cerr << "[rate] third message in window not limited\n";
        return false;
    }
    const auto r = rig.lastReply();
    if (r["data"]["error_type"] != "RATE_LIMIT_EXCEEDED" ||
        r["data"]["message"] != "Message rate limit exceeded. Limit: 2 messages per 60 seconds. Try again in 60 seconds.") {
        std::cerr << "[rate] reply mismatch: " << rig.transport->sent.back().second << "\n";
        return false;
    }

    // 같은 플레이어의 다른 연결은 별도 창
    if (rig.factory.handle(otherCtx, ping) != HandleResult::Dispatched) {
        std::cerr << "[rate] limit leaked across connections\n";
        return false;
    }

    clock.advance(60s);
    if (rig.factory.handle(rig.ctx, ping) != HandleResult::Dispatched) {
        std::cerr << "[rate] window did not slide\n";
        return false;
    }

    rig.factory.handle(rig.ctx, ping);
    rig.factory.forgetConnection(rig.transport->id());
    if (rig.factory.handle(rig.ctx, ping) != HandleResult::Dispatched) {
        std::cerr << "[rate] forgetConnection kept history\n";
        return false;
    }
    return true;
}

bool test_handler_exceptions() {
    Rig rig;
    auto thrower = std::make_shared<ThrowingHandler>();
    rig.factory.registerHandler("boom", thrower);

    if (rig.factory.handle(rig.ctx, R"({"type":"boom"})") != HandleResult::Failed || !rig.transport->sent.empty()) {
        std::cerr << "[throw] generic failure should not reply\n";
        return false;
    }

    thrower->tooLarge = true;
    if (rig.factory.handle(rig.ctx, R"({"type":"boom"})") != HandleResult::Failed || rig.transport->sent.size() != 1 ||
        rig.lastReply()["data"]["error_type"] != "PAYLOAD_TOO_LARGE") {
        std::cerr << "[throw] PayloadTooLarge not reported to sender\n";
        return false;
    }

    try {
        rig.factory.registerHandler("", thrower);
        std::cerr << "[throw] empty type accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

bool test_reply_to_closed_connection_is_dropped() {
    Rig rig;
    rig.transport->close();
    mudcast::monitoring::deliveryMetrics().reset();

    if (rig.factory.handle(rig.ctx, R"({"type":"foo"})") != HandleResult::UnknownType || !rig.transport->sent.empty()) {
        std::cerr << "[closed] reply on closed connection\n";
        return false;
    }
    const auto snap = mudcast::monitoring::deliveryMetrics().snapshot();
    if (snap.inboundMessagesTotal != 1 || snap.inboundErrorsTotal != 1) {
        std::cerr << "[closed] inbound metrics mismatch\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_unknown_type_yields_single_invalid_command();
    ok &= test_malformed_frames();
    ok &= test_command_and_legacy_alias();
    ok &= test_chat_defaults_and_ping();
    ok &= test_rate_limit_per_connection();
    ok &= test_handler_exceptions();
    ok &= test_reply_to_closed_connection_is_dropped();

    if (!ok) {
        std::cerr << "Inbound tests FAILED\n";
        return 1;
    }
    std::cout << "Inbound tests PASSED\n";
    return 0;
}
