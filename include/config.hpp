#pragma once
#include "devices.hpp"
#include "hardware.hpp"
#include <chrono>
#include <cstdint>
#include <string>

struct CentralConfig {
    std::string ip = "0.0.0.0";
    uint16_t port = 8080;
    uint16_t adminPort = 8081;
    std::string dataDir = "data";
    std::string logFile = "central.log";
    std::string logLevel = "info";
    double ratePerMinute = 0.15;
    double minimumFee = 2.00;
    std::chrono::seconds connectionTimeout{30};
};

struct LaneDeviceConfig {
    int presenceLine = -1;
    int relayLine = -1;
    int passageLine = -1;
    CameraSettings camera;
};

struct LaneNodeConfig {
    std::string centralIp = "127.0.0.1";
    uint16_t centralPort = 8080;
    bool simulationMode = true;
    std::string floor = "terreo";
    double confidenceMin = 0.8;
    std::chrono::milliseconds passageTimeout{10000};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds errorBackoff{10000};
    std::chrono::milliseconds pollInterval{1000};
    std::chrono::milliseconds gateTravel{2000};
    std::size_t totalSlots = 8;
    std::string logFile = "lane.log";
    std::string logLevel = "info";
    std::chrono::seconds statsInterval{300};
    std::string gpioRoot = "/sys/class/gpio";
    LaneDeviceConfig entry;
    LaneDeviceConfig exit;
    SimulationSettings simulation;
};

// 文件无法打开或 JSON 格式错误时抛出 ConfigError，缺省字段取默认值
CentralConfig loadCentralConfig(const std::string& path);
LaneNodeConfig loadLaneConfig(const std::string& path);
