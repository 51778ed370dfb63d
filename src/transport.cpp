#include "../include/transport.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/protocol.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <curl/curl.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

// 连接套接字的 RAII 封装，任何路径退出都会关闭
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd(fd) {}
    ~SocketGuard() {
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd; }

private:
    int fd;
};

// 读到第一个换行为止；对端关闭时返回已收到的内容
std::string readLine(int fd, std::chrono::seconds timeout) {
    std::string buffer;
    char chunk[1024];
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw ProtocolError("timed out waiting for request");
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ProtocolError(std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) continue;

        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw ProtocolError(std::string("recv failed: ") + strerror(errno));
        }
        if (n == 0) return buffer;

        buffer.append(chunk, static_cast<std::size_t>(n));
        auto pos = buffer.find('\n');
        if (pos != std::string::npos) {
            return buffer.substr(0, pos);
        }
        if (buffer.size() > protocol::kMaxLineLength) {
            throw ProtocolError("request line too long");
        }
    }
}

void sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ProtocolError(std::string("send failed: ") + strerror(errno));
        }
        sent += static_cast<std::size_t>(n);
    }
}

std::once_flag curlInitFlag;

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

bool waitSocket(curl_socket_t sock, bool forRead, std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return false;
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = forRead ? POLLIN : POLLOUT;
    pfd.revents = 0;
    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0 && errno == EINTR) return true;
    return rc > 0;
}

}

TcpLineServer::TcpLineServer(Handler handler, std::chrono::seconds readTimeout)
    : handler(std::move(handler)), readTimeout(readTimeout) {}

TcpLineServer::~TcpLineServer() {
    stop();
    if (serverSocket >= 0) {
        close(serverSocket);
        serverSocket = -1;
    }
}

uint16_t TcpLineServer::bind(const std::string& ip, uint16_t port) {
    // 1. 创建服务器socket
    serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // 2. 设置socket选项
    int opt = 1;
    if (setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close(serverSocket);
        serverSocket = -1;
        throw std::runtime_error("Failed to set socket options");
    }

    // 3. 准备地址结构并绑定
    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        serverAddr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &serverAddr.sin_addr) != 1) {
        close(serverSocket);
        serverSocket = -1;
        throw std::runtime_error("Invalid listen address: " + ip);
    }

    if (::bind(serverSocket, reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr)) < 0) {
        std::string reason = strerror(errno);
        close(serverSocket);
        serverSocket = -1;
        throw std::runtime_error("Failed to bind socket: " + reason);
    }

    // 4. 开始监听连接
    if (listen(serverSocket, SOMAXCONN) < 0) {
        close(serverSocket);
        serverSocket = -1;
        throw std::runtime_error("Failed to listen on socket");
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(serverSocket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        boundPort = ntohs(bound.sin_port);
    } else {
        boundPort = port;
    }
    running = true;
    return boundPort;
}

void TcpLineServer::serve() {
    if (serverSocket < 0) {
        throw std::runtime_error("serve() called before bind()");
    }
    Logger::logSystem(Logger::Level::Info, "transport", "Listening on port " + std::to_string(boundPort));

    while (running) {
        // 设置poll的超时，以便能够及时响应停止命令
        struct pollfd pfd;
        pfd.fd = serverSocket;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::logSystem(Logger::Level::Error, "transport", std::string("Poll error: ") + strerror(errno));
            break;
        }
        if (ready == 0) continue;

        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(serverSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientSocket < 0) {
            Logger::logSystem(Logger::Level::Warning, "transport", std::string("Failed to accept connection: ") + strerror(errno));
            continue;
        }

        char addr[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, addr, sizeof(addr));
        std::string peer = std::string(addr) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        ++connections;
        std::thread([this, clientSocket, peer] {
            handleConnection(clientSocket, peer);
            std::lock_guard<std::mutex> lock(drainMutex);
            --connections;
            drained.notify_all();
        }).detach();
    }

    close(serverSocket);
    serverSocket = -1;

    std::unique_lock<std::mutex> lock(drainMutex);
    drained.wait(lock, [this] { return connections.load() == 0; });
    Logger::logSystem(Logger::Level::Info, "transport", "Server stopped");
}

void TcpLineServer::stop() {
    running = false;
}

void TcpLineServer::handleConnection(int clientSocket, const std::string& peer) {
    SocketGuard guard(clientSocket);
    Logger::logSystem(Logger::Level::Debug, "transport", "Client connected: " + peer);
    try {
        std::string line = readLine(guard.get(), readTimeout);
        if (line.empty()) {
            Logger::logSystem(Logger::Level::Debug, "transport", "Client disconnected without request: " + peer);
            return;
        }
        std::string reply = handler(line);
        sendAll(guard.get(), reply);
    } catch (const ProtocolError& e) {
        // 非法报文只记录并断开，不产生答复
        Logger::logSystem(Logger::Level::Warning, "transport", "Dropping connection " + peer + ": " + e.what());
    } catch (const std::exception& e) {
        Logger::logSystem(Logger::Level::Error, "transport", "Error handling client " + peer + ": " + e.what());
    }
}

LineClient::LineClient(std::string host, uint16_t port, std::chrono::milliseconds timeout)
    : hostName(std::move(host)), portNumber(port), timeout(timeout) {}

std::string LineClient::request(const std::string& line) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ProtocolError("CURL initialization failed");
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::string url = "http://" + hostName + ":" + std::to_string(portNumber);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ProtocolError("connection to " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_socket_t sock = CURL_SOCKET_BAD;
    res = curl_easy_getinfo(curl.get(), CURLINFO_ACTIVESOCKET, &sock);
    if (res != CURLE_OK || sock == CURL_SOCKET_BAD) {
        throw ProtocolError("no active socket for " + url);
    }

    std::size_t sent = 0;
    while (sent < line.size()) {
        std::size_t n = 0;
        res = curl_easy_send(curl.get(), line.data() + sent, line.size() - sent, &n);
        if (res == CURLE_AGAIN) {
            if (!waitSocket(sock, false, deadline)) {
                throw ProtocolError("timed out sending request to " + url);
            }
            continue;
        }
        if (res != CURLE_OK) {
            throw ProtocolError(std::string("send failed: ") + curl_easy_strerror(res));
        }
        sent += n;
    }

    std::string buffer;
    char chunk[1024];
    while (true) {
        std::size_t n = 0;
        res = curl_easy_recv(curl.get(), chunk, sizeof(chunk), &n);
        if (res == CURLE_AGAIN) {
            if (!waitSocket(sock, true, deadline)) {
                throw ProtocolError("timed out waiting for reply from " + url);
            }
            continue;
        }
        if (res != CURLE_OK) {
            throw ProtocolError(std::string("recv failed: ") + curl_easy_strerror(res));
        }
        if (n == 0) break;

        buffer.append(chunk, n);
        auto pos = buffer.find('\n');
        if (pos != std::string::npos) {
            return buffer.substr(0, pos);
        }
        if (buffer.size() > protocol::kMaxLineLength) {
            throw ProtocolError("reply line too long");
        }
    }

    if (buffer.empty()) {
        throw ProtocolError("connection closed by " + url + " without reply");
    }
    return buffer;
}
