#include "../include/central_authority.hpp"
#include "../include/errors.hpp"
#include "../include/lane_controller.hpp"
#include "../include/logger.hpp"
#include "../include/protocol.hpp"
#include "../include/transport.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

namespace {

// 只连接不发送的客户端
int connectIdle(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    return fd;
}

// 测试期间把日志写到临时文件，结束时恢复
class LogFileScope {
public:
    explicit LogFileScope(const std::string& path) { Logger::setLogFile(path); }
    ~LogFileScope() { Logger::setLogFile(""); }
};

}

class TransportTest : public ::testing::Test {
protected:
    void startServer(TcpLineServer::Handler handler) {
        server = std::make_unique<TcpLineServer>(std::move(handler), std::chrono::seconds(2));
        port = server->bind("127.0.0.1", 0);
        serverThread = std::thread([this] { server->serve(); });
    }

    void TearDown() override {
        if (server) {
            server->stop();
            serverThread.join();
        }
    }

    LineClient client() const { return LineClient("127.0.0.1", port, std::chrono::milliseconds(2000)); }

    std::unique_ptr<TcpLineServer> server;
    std::thread serverThread;
    uint16_t port = 0;
};

TEST_F(TransportTest, EphemeralPortIsReported) {
    startServer([](const std::string& line) { return line + "\n"; });
    EXPECT_NE(port, 0);
    EXPECT_EQ(server->port(), port);
}

TEST_F(TransportTest, OneLineInOneLineOut) {
    startServer([](const std::string& line) { return "echo:" + line + "\n"; });
    EXPECT_EQ(client().request("hello\n"), "echo:hello");
}

TEST_F(TransportTest, ConcurrentClients) {
    startServer([](const std::string& line) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return line + "\n";
    });
    std::atomic<int> ok{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 8; ++i) {
        clients.emplace_back([this, i, &ok] {
            std::string msg = "client" + std::to_string(i);
            if (client().request(msg + "\n") == msg) ++ok;
        });
    }
    for (auto& t : clients) t.join();
    EXPECT_EQ(ok.load(), 8);
}

TEST_F(TransportTest, HandlerProtocolErrorClosesWithoutReply) {
    startServer([](const std::string& line) -> std::string { throw ProtocolError("bad line: " + line); });
    EXPECT_THROW(client().request("garbage\n"), ProtocolError);
}

TEST_F(TransportTest, ConnectionRefused) {
    startServer([](const std::string& line) { return line + "\n"; });
    uint16_t unused = port;
    server->stop();
    serverThread.join();
    server.reset();
    EXPECT_THROW(LineClient("127.0.0.1", unused, std::chrono::milliseconds(500)).request("x\n"), ProtocolError);
}

TEST_F(TransportTest, CentralAuthorityOverTcp) {
    MemoryStore store;
    CentralAuthority central(store, Tariff{});
    startServer([&central](const std::string& line) { return central.handleRequest(line); });

    TcpAuthorityLink link("127.0.0.1", port, std::chrono::milliseconds(2000));
    EventResponse entry = link.submit(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00"));
    EXPECT_EQ(entry.action, GateAction::OpenGate);

    EventResponse again = link.submit(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:10:00"));
    EXPECT_EQ(again.action, GateAction::DenyEntry);

    EventResponse exit = link.submit(makeEvent("ABC1234", EventKind::Exit, "2024-01-15T10:30:00"));
    EXPECT_EQ(exit.action, GateAction::Charge);
    EXPECT_DOUBLE_EQ(exit.fee.value_or(0.0), 4.50);
    EXPECT_EQ(exit.durationMinutes, std::optional<int>(30));
}

TEST_F(TransportTest, MalformedJsonGetsNoReply) {
    MemoryStore store;
    CentralAuthority central(store, Tariff{});
    startServer([&central](const std::string& line) { return central.handleRequest(line); });

    EXPECT_THROW(client().request("{\"placa\": \n"), ProtocolError);
    EXPECT_TRUE(store.events.empty());
}

TEST_F(TransportTest, InvalidUtf8RequestIsDroppedAndServerKeepsRunning) {
    TempDir tmp;
    LogFileScope scope(tmp.file("garage.log"));
    MemoryStore store;
    CentralAuthority central(store, Tariff{});
    startServer([&central](const std::string& line) { return central.handleRequest(line); });

    EXPECT_THROW(client().request("\xff\xfe garbage\n"), ProtocolError);

    TcpAuthorityLink link("127.0.0.1", port, std::chrono::milliseconds(2000));
    EventResponse entry = link.submit(makeEvent("ABC1234", EventKind::Entry, "2024-01-15T10:00:00"));
    EXPECT_EQ(entry.action, GateAction::OpenGate);

    std::ifstream log(tmp.file("garage.log"));
    std::string content((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("Dropping connection"), std::string::npos);
}

TEST_F(TransportTest, ManyIdleConnectionsDoNotBlockRequests) {
    startServer([](const std::string& line) { return "echo:" + line + "\n"; });
    std::vector<int> idle;
    for (int i = 0; i < 100; ++i) {
        int fd = connectIdle(port);
        if (fd >= 0) idle.push_back(fd);
    }
    EXPECT_EQ(idle.size(), 100u);

    EXPECT_EQ(client().request("hello\n"), "echo:hello");

    for (int fd : idle) close(fd);
}
