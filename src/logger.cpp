#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

std::mutex Logger::logMutex;
std::string Logger::logFile = "system.log";
Logger::Level Logger::threshold = Logger::Level::Info;
bool Logger::echo = true;

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logFile = path;
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(logMutex);
    threshold = level;
}

void Logger::setEcho(bool enabled) {
    std::lock_guard<std::mutex> lock(logMutex);
    echo = enabled;
}

std::string Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warning: return "warning";
        case Level::Error: return "error";
    }
    return "info";
}

Logger::Level Logger::parseLevel(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning") return Level::Warning;
    if (name == "error") return Level::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

void Logger::writeLog(Level level, nlohmann::json log) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (level < threshold) return;
    log["level"] = levelName(level);
    // print log to terminal in human-readable format
    if (echo) {
        std::ostream& out = level >= Level::Warning ? std::cerr : std::cout;
        out << log.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }
    if (logFile.empty()) return;
    std::ofstream file(logFile, std::ios::app);
    if (file) {
        file << log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
}

void Logger::logVehicle(const std::string& plate, const std::string& action, const std::string& message,
                        Level level) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"license_plate", plate},
        {"action", action},
        {"message", message}
    };
    writeLog(level, std::move(log));
}

void Logger::logLane(const std::string& lane, const std::string& state, const std::string& message,
                     Level level) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"lane", lane},
        {"state", state},
        {"message", message}
    };
    writeLog(level, std::move(log));
}

void Logger::logAdmin(const std::string& user, const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"user", user},
        {"action", action},
        {"message", message}
    };
    writeLog(Level::Info, std::move(log));
}

void Logger::logSystem(Level level, const std::string& component, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"component", component},
        {"message", message}
    };
    writeLog(level, std::move(log));
}
