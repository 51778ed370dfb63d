#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>

class Database;

/**
 * 管理接口的账号认证：users.json 中保存 SHA256 口令，
 * 登录成功后签发内存令牌，闲置超过 idleTimeout 或服务重启即失效。
 */
class Auth {
public:
    struct Session {
        std::string username;
        std::string role;
        std::chrono::steady_clock::time_point lastSeen;
    };

    explicit Auth(Database& db, std::chrono::minutes idleTimeout = std::chrono::minutes(60));

    bool loginUser(const std::string& username, const std::string& password, std::string& token, std::string& role);
    // 有效时刷新闲置计时
    bool validateToken(const std::string& token, std::string& role, std::string& username);
    void removeToken(const std::string& token);
    std::size_t activeSessions();

private:
    Database& db;
    std::chrono::minutes idleTimeout;
    std::mutex sessionsMutex;
    std::map<std::string, Session> sessions;

    static std::string generateToken();
    void purgeExpiredLocked(std::chrono::steady_clock::time_point now);
};
