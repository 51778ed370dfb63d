#include "../include/auth.hpp"
#include "../include/database.hpp"
#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

Auth::Auth(Database& db, std::chrono::minutes idleTimeout) : db(db), idleTimeout(idleTimeout) {}

// 32 字节随机数的十六进制串
std::string Auth::generateToken() {
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    std::ostringstream out;
    for (int i = 0; i < 32; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << byte(rd);
    }
    return out.str();
}

void Auth::purgeExpiredLocked(std::chrono::steady_clock::time_point now) {
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (now - it->second.lastSeen > idleTimeout) {
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
}

// 只接受 admin 与 operator 两种角色
bool Auth::loginUser(const std::string& username, const std::string& password, std::string& token, std::string& role) {
    json users = db.getUsers();
    if (!users.is_array()) {
        Logger::logSystem(Logger::Level::Error, "auth", "users.json must contain an array");
        return false;
    }

    auto match = std::find_if(users.begin(), users.end(), [&username](const json& user) {
        return user.is_object() && user.value("username", std::string()) == username;
    });
    if (match == users.end()) return false;

    std::string storedHash = match->value("auth", std::string());
    std::string userRole = match->value("role", std::string());
    if (userRole != "admin" && userRole != "operator") return false;
    if (storedHash.empty() || utils::sha256(password) != storedHash) return false;

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(sessionsMutex);
    purgeExpiredLocked(now);
    token = generateToken();
    sessions[token] = Session{username, userRole, now};
    role = userRole;
    return true;
}

bool Auth::validateToken(const std::string& token, std::string& role, std::string& username) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(sessionsMutex);
    auto it = sessions.find(token);
    if (it == sessions.end()) return false;
    if (now - it->second.lastSeen > idleTimeout) {
        sessions.erase(it);
        return false;
    }
    it->second.lastSeen = now;
    role = it->second.role;
    username = it->second.username;
    return true;
}

void Auth::removeToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    sessions.erase(token);
}

std::size_t Auth::activeSessions() {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    purgeExpiredLocked(std::chrono::steady_clock::now());
    return sessions.size();
}
