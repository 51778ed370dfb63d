#include "../include/config.hpp"
#include "../include/devices.hpp"
#include "../include/errors.hpp"
#include "../include/hardware.hpp"
#include "../include/lane_controller.hpp"
#include "../include/logger.hpp"
#include "../include/slot_board.hpp"
#include <cerrno>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <sstream>

namespace {

struct LaneDevices {
    std::unique_ptr<PresenceSensor> presence;
    std::unique_ptr<PlateCapture> camera;
    std::unique_ptr<GateDriver> gate;
};

LaneDevices simulatedDevices(const std::string& lane, const SimulationSettings& settings) {
    LaneDevices devices;
    devices.presence = std::make_unique<SimulatedPresenceSensor>(lane, settings);
    devices.camera = std::make_unique<SimulatedPlateCapture>(settings);
    devices.gate = std::make_unique<SimulatedGate>(lane, settings);
    return devices;
}

// 硬件初始化失败时退回模拟设备，车道照常运行
LaneDevices makeDevices(const std::string& lane, const LaneDeviceConfig& device, const LaneNodeConfig& config,
                        const SimulationSettings& simulation) {
    if (config.simulationMode) {
        return simulatedDevices(lane, simulation);
    }
    try {
        LaneDevices devices;
        devices.presence = std::make_unique<HardwarePresenceSensor>(lane, device.presenceLine, config.gpioRoot);
        devices.camera = std::make_unique<HardwarePlateCapture>(device.camera);
        devices.gate = std::make_unique<HardwareGate>(lane, device.relayLine, device.passageLine,
                                                      config.gateTravel, config.gpioRoot);
        Logger::logSystem(Logger::Level::Info, lane, "Hardware devices initialized");
        return devices;
    } catch (const HardwareError& e) {
        Logger::logSystem(Logger::Level::Warning, lane,
                          std::string("Hardware unavailable, using simulation: ") + e.what());
        return simulatedDevices(lane, simulation);
    }
}

std::string describeSlots(const SlotStats& stats) {
    std::ostringstream out;
    out << stats.free << "/" << stats.total << " free (" << static_cast<int>(stats.occupiedPercent) << "% occupied)";
    if (stats.full) out << " FULL";
    return out.str();
}

}

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config_lane.json";

    LaneNodeConfig config;
    try {
        config = loadLaneConfig(configPath);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    Logger::setLogFile(config.logFile);
    Logger::setLevel(Logger::parseLevel(config.logLevel));

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    SlotBoard board(config.totalSlots, [](const SlotStats& stats) {
        Logger::logSystem(Logger::Level::Info, "slot_display", describeSlots(stats));
    });

    // 两条车道的模拟设备使用不同的随机种子
    SimulationSettings exitSimulation = config.simulation;
    exitSimulation.seed = config.simulation.seed + 7919;
    LaneDevices entryDevices = makeDevices("lane_entrada", config.entry, config, config.simulation);
    LaneDevices exitDevices = makeDevices("lane_saida", config.exit, config, exitSimulation);

    TcpAuthorityLink entryLink(config.centralIp, config.centralPort, config.requestTimeout);
    TcpAuthorityLink exitLink(config.centralIp, config.centralPort, config.requestTimeout);

    LaneSettings settings;
    settings.floor = config.floor;
    settings.confidenceMin = config.confidenceMin;
    settings.passageTimeout = config.passageTimeout;
    settings.errorBackoff = config.errorBackoff;
    settings.pollInterval = config.pollInterval;

    LaneController entryLane(LaneKind::Entry, settings, *entryDevices.presence, *entryDevices.camera,
                         *entryDevices.gate, entryLink, board);
    LaneController exitLane(LaneKind::Exit, settings, *exitDevices.presence, *exitDevices.camera,
                        *exitDevices.gate, exitLink, board);

    Logger::logSystem(Logger::Level::Info, "lane_node",
                      std::string("Lane node started in ") + (config.simulationMode ? "simulation" : "hardware") +
                      " mode, central at " + config.centralIp + ":" + std::to_string(config.centralPort));
    entryLane.start();
    exitLane.start();

    // 定期输出车道状态和车位统计，直到收到退出信号
    while (true) {
        timespec wait;
        wait.tv_sec = static_cast<time_t>(config.statsInterval.count());
        wait.tv_nsec = 0;
        int received = sigtimedwait(&signals, nullptr, &wait);
        if (received == SIGINT || received == SIGTERM) {
            Logger::logSystem(Logger::Level::Info, "lane_node",
                              "Signal " + std::to_string(received) + " received, stopping lanes");
            break;
        }
        if (received < 0 && errno != EAGAIN && errno != EINTR) {
            Logger::logSystem(Logger::Level::Error, "lane_node", "sigtimedwait failed");
            break;
        }
        SlotStats stats = board.stats();
        Logger::logSystem(Logger::Level::Info, "lane_node",
                          "entrada=" + toString(entryLane.state()) + " saida=" + toString(exitLane.state()) +
                          ", slots " + describeSlots(stats));
    }

    entryLane.stop();
    exitLane.stop();
    Logger::logSystem(Logger::Level::Info, "lane_node", "Lane node stopped");
    return 0;
}
