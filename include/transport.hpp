#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

/**
 * 行协议 TCP 服务端：每个连接一个线程，读一行、答一行、关闭。
 * handler 抛出 ProtocolError 时不答复，直接断开连接。
 */
class TcpLineServer {
public:
    using Handler = std::function<std::string(const std::string& line)>;

    TcpLineServer(Handler handler, std::chrono::seconds readTimeout = std::chrono::seconds(30));
    ~TcpLineServer();

    TcpLineServer(const TcpLineServer&) = delete;
    TcpLineServer& operator=(const TcpLineServer&) = delete;

    // 端口为 0 时由系统分配，返回实际监听端口
    uint16_t bind(const std::string& ip, uint16_t port);
    // 阻塞直到 stop()，返回前等待所有连接处理完毕
    void serve();
    void stop();

    std::size_t activeConnections() const { return connections.load(); }
    uint16_t port() const { return boundPort; }

private:
    Handler handler;
    std::chrono::seconds readTimeout;
    int serverSocket = -1;
    uint16_t boundPort = 0;
    std::atomic<bool> running{false};
    std::atomic<std::size_t> connections{0};
    std::mutex drainMutex;
    std::condition_variable drained;

    void handleConnection(int clientSocket, const std::string& peer);
};

/**
 * 行协议客户端（libcurl CONNECT_ONLY）：建立连接、写一行、读一行、关闭。
 * 连接失败、超时、对端提前关闭都抛出 ProtocolError。
 */
class LineClient {
public:
    LineClient(std::string host, uint16_t port, std::chrono::milliseconds timeout);

    std::string request(const std::string& line);

    const std::string& host() const { return hostName; }
    uint16_t port() const { return portNumber; }

private:
    std::string hostName;
    uint16_t portNumber;
    std::chrono::milliseconds timeout;
};
