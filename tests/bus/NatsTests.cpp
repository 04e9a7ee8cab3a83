#include <mudcast/bus/NatsBrokerClient.hpp>
#include <mudcast/bus/NatsProtocol.hpp>
#include <mudcast/core/Logger.hpp>
#include <mudcast/core/MemoryLogger.hpp>
#include <mudcast/net/Socket.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mudcast::bus;
using mudcast::net::Socket;

namespace {

using namespace std::chrono_literals;

bool test_encoders() {
    if (nats::encodePub("room.a.b", "hello") != "PUB room.a.b 5\r\nhello\r\n") {
        std::cerr << "[enc] PUB mismatch\n";
        return false;
    }
    if (nats::encodeSub("room.>", 7) != "SUB room.> 7\r\n" || nats::encodeUnsub(7) != "UNSUB 7\r\n") {
        std::cerr << "[enc] SUB/UNSUB mismatch\n";
        return false;
    }

    nats::ConnectOptions opt;
    opt.name = "node-1";
    opt.token = "secret";
    const auto line = nats::encodeConnect(opt);
    if (line.rfind("CONNECT ", 0) != 0 || line.substr(line.size() - 2) != "\r\n") {
        std::cerr << "[enc] CONNECT framing mismatch\n";
        return false;
    }
    const auto j = nlohmann::json::parse(line.substr(8, line.size() - 10));
    if (j["name"] != "node-1" || j["auth_token"] != "secret" || j["verbose"] != false || j.contains("user")) {
        std::cerr << "[enc] CONNECT json mismatch\n";
        return false;
    }
    return true;
}

/// MSG payload 가 여러 조각으로 나뉘어 와도 완성된 뒤에만 op 가 나옵니다.
bool test_parser_split_msg() {
    nats::Parser p;
    nats::ServerOp op;

    p.feed("INFO {\"server_id\":\"x\"}\r\nMSG room.a.b 3 1");
    if (!p.next(op) || op.kind != nats::ServerOp::Kind::Info || op.payload != "{\"server_id\":\"x\"}") {
        std::cerr << "[parser] INFO mismatch\n";
        return false;
    }
    if (p.next(op)) {
        std::cerr << "[parser] incomplete header produced op\n";
        return false;
    }

    p.feed("1\r\nhello");
    if (p.next(op)) {
        std::cerr << "[parser] incomplete payload produced op\n";
        return false;
    }

    p.feed(" world\r\nPING\r\n+OK\r\n-ERR 'Unknown Subject'\r\n");
    if (!p.next(op) || op.kind != nats::ServerOp::Kind::Msg || op.subject != "room.a.b" || op.sid != 3 ||
        op.payload != "hello world") {
        std::cerr << "[parser] MSG mismatch\n";
        return false;
    }
    if (!p.next(op) || op.kind != nats::ServerOp::Kind::Ping) {
        std::cerr << "[parser] PING mismatch\n";
        return false;
    }
    if (!p.next(op) || op.kind != nats::ServerOp::Kind::Ok) {
        std::cerr << "[parser] +OK mismatch\n";
        return false;
    }
    if (!p.next(op) || op.kind != nats::ServerOp::Kind::Err || op.payload != "'Unknown Subject'") {
        std::cerr << "[parser] -ERR mismatch\n";
        return false;
    }
    return p.buffered() == 0;
}

bool test_parser_reply_to_and_garbage() {
    nats::Parser p;
    nats::ServerOp op;

    p.feed("MSG global 2 _INBOX.1 2\r\nhi\r\n");
    if (!p.next(op) || op.subject != "global" || op.sid != 2 || op.payload != "hi") {
        std::cerr << "[parser] reply-to MSG mismatch\n";
        return false;
    }

    p.feed("BOGUS\r\n");
    try {
        (void)p.next(op);
        std::cerr << "[parser] unknown op accepted\n";
        return false;
    } catch (const std::runtime_error &) {
    }
    return true;
}

/// localhost 에 붙는 최소 NATS 서버 흉내.
class FakeNatsServer {
  public:
    FakeNatsServer() {
        listener_ = Socket::createTcpIPv4();
        if (!listener_.setReuseAddr(true) || !listener_.bind("127.0.0.1", 0) || !listener_.listen(4))
            throw std::runtime_error("fake nats: listen failed");
        port_ = listener_.localPort();
    }

    ~FakeNatsServer() {
        if (thread_.joinable())
            thread_.join();
    }

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    /// INFO 전송 -> PING 까지 수신 -> PONG, MSG(sid 1), PING 송신 -> PUB 까지 수신
    void runScript() {
        thread_ = std::thread([this]() {
            Socket conn = listener_.accept();
            if (!conn.isValid() || !conn.setRecvTimeoutMs(100))
                return;

            const std::string info = "INFO {\"server_id\":\"fake\",\"max_payload\":1048576}\r\n";
            (void)conn.send(info.data(), info.size());

            if (!readUntil(conn, "PING\r\n"))
                return;

            const std::string burst = "PONG\r\nMSG room.a.b 1 5\r\nhello\r\nPING\r\n";
            (void)conn.send(burst.data(), burst.size());

            (void)readUntil(conn, "PUB global 2\r\nhi\r\n");
            done_.store(true);
        });
    }

    [[nodiscard]] std::string received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    [[nodiscard]] bool done() const noexcept { return done_.load(); }

  private:
    bool readUntil(Socket &conn, const std::string &needle) {
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        char buf[1024];
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (received_.find(needle) != std::string::npos)
                    return true;
            }
            const auto n = conn.recv(buf, sizeof(buf));
            if (n == 0)
                return false;
            if (n > 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                received_.append(buf, static_cast<std::size_t>(n));
            }
        }
        return false;
    }

    Socket listener_;
    std::uint16_t port_{0};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string received_;
    std::atomic<bool> done_{false};
};

bool test_client_against_fake_server() {
    FakeNatsServer server;
    server.runScript();

    NatsBrokerClient::Options opt;
    opt.port = server.port();
    opt.connectTimeoutMs = 2000;
    opt.connect.name = "node-test";
    NatsBrokerClient client(opt);

    std::mutex gotMutex;
    std::vector<std::string> got;
    // 접속 전에 등록한 구독은 connect 시 같이 SUB 된다.
    const auto sid = client.subscribe("room.>", [&](const std::string &subject, const std::string &payload) {
        std::lock_guard<std::mutex> lock(gotMutex);
        got.push_back(subject + "=" + payload);
    });
    if (sid != 1) {
        std::cerr << "[client] first sid=" << sid << "\n";
        return false;
    }

    client.connect();
    if (!client.isConnected()) {
        std::cerr << "[client] not connected after connect()\n";
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(gotMutex);
            if (!got.empty())
                break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[client] MSG never dispatched\n";
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }

    client.publish("global", "hi");

    while (!server.done() && std::chrono::steady_clock::now() < deadline + 3s)
        std::this_thread::sleep_for(5ms);

    const auto wire = server.received();
    client.disconnect();

    if (wire.rfind("CONNECT {", 0) != 0 || wire.find("SUB room.> 1\r\n") == std::string::npos) {
        std::cerr << "[client] handshake bytes mismatch: " << wire << "\n";
        return false;
    }
    if (wire.find("PONG\r\n") == std::string::npos) {
        std::cerr << "[client] server PING was not answered\n";
        return false;
    }
    if (!server.done()) {
        std::cerr << "[client] PUB never reached server\n";
        return false;
    }

    std::lock_guard<std::mutex> lock(gotMutex);
    if (got.size() != 1 || got[0] != "room.a.b=hello") {
        std::cerr << "[client] dispatched payload mismatch\n";
        return false;
    }
    return true;
}

/// 아무도 listen 하지 않는 포트면 connect/publish 는 BrokerError 입니다.
bool test_connect_refused_is_broker_error() {
    std::uint16_t port = 0;
    {
        Socket unused = Socket::createTcpIPv4();
        if (!unused.bind("127.0.0.1", 0)) {
            std::cerr << "[refused] bind failed\n";
            return false;
        }
        port = unused.localPort();
    }

    NatsBrokerClient::Options opt;
    opt.port = port;
    opt.connectTimeoutMs = 200;
    NatsBrokerClient client(opt);

    try {
        client.publish("global", "x");
        std::cerr << "[refused] publish succeeded without a server\n";
        return false;
    } catch (const BrokerError &) {
    }
    return !client.isConnected();
}

/// 응답 없는 broker 주소에서도 connect 는 connectTimeoutMs 근처에서 BrokerError 로 끝납니다.
bool test_unreachable_broker_is_bounded() {
    NatsBrokerClient::Options opt;
    opt.host = "192.0.2.1";
    opt.port = 4222;
    opt.connectTimeoutMs = 200;
    NatsBrokerClient client(opt);

    const auto started = std::chrono::steady_clock::now();
    try {
        client.publish("global", "x");
        std::cerr << "[unreachable] publish succeeded\n";
        return false;
    } catch (const BrokerError &) {
    }
    if (std::chrono::steady_clock::now() - started > 2s) {
        std::cerr << "[unreachable] connect was not bounded by connectTimeoutMs\n";
        return false;
    }
    return !client.isConnected();
}

} // namespace

int main() {
    mudcast::core::setLogger(std::make_shared<mudcast::core::MemoryLogger>());

    bool ok = true;

    ok = ok && test_encoders();
    ok = ok && test_parser_split_msg();
    ok = ok && test_parser_reply_to_and_garbage();
    ok = ok && test_client_against_fake_server();
    ok = ok && test_connect_refused_is_broker_error();
    ok = ok && test_unreachable_broker_is_bounded();

    if (!ok) {
        std::cerr << "Nats tests FAILED\n";
        return 1;
    }

    std::cout << "Nats tests PASSED\n";
    return 0;
}
