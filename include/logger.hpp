#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

class Logger {
public:
    enum class Level { Debug = 0, Info, Warning, Error };

    static void setLogFile(const std::string& path);
    static void setLevel(Level level);
    static void setEcho(bool enabled);

    static void logVehicle(const std::string& plate, const std::string& action, const std::string& message,
                           Level level = Level::Info);
    static void logLane(const std::string& lane, const std::string& state, const std::string& message,
                        Level level = Level::Info);
    static void logAdmin(const std::string& user, const std::string& action, const std::string& message);
    static void logSystem(Level level, const std::string& component, const std::string& message);

    static std::string levelName(Level level);
    // 未知名称抛出 std::invalid_argument
    static Level parseLevel(const std::string& name);

private:
    static std::mutex logMutex;
    static std::string logFile;
    static Level threshold;
    static bool echo;
    static void writeLog(Level level, nlohmann::json log);
};
