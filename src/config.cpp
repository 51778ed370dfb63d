#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

namespace {

json readConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }
    try {
        json config;
        file >> config;
        if (!config.is_object()) {
            throw ConfigError(path + " must contain a JSON object");
        }
        return config;
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
}

uint16_t portValue(const json& config, const char* key, uint16_t fallback) {
    int port = config.value(key, static_cast<int>(fallback));
    if (port < 0 || port > 65535) {
        throw ConfigError(std::string(key) + " out of range");
    }
    return static_cast<uint16_t>(port);
}

void checkLevel(const std::string& level) {
    try {
        Logger::parseLevel(level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

LaneDeviceConfig deviceConfig(const json& block) {
    LaneDeviceConfig device;
    if (!block.is_object()) return device;
    device.presenceLine = block.value("presence_gpio", -1);
    device.relayLine = block.value("relay_gpio", -1);
    device.passageLine = block.value("passage_gpio", -1);
    if (block.contains("camera")) {
        const json& camera = block["camera"];
        device.camera.device = camera.value("device", 0);
        device.camera.cascadePath = camera.value("cascade", device.camera.cascadePath);
        device.camera.ocrLanguage = camera.value("ocr_language", device.camera.ocrLanguage);
        device.camera.frameWidth = camera.value("frame_width", device.camera.frameWidth);
        device.camera.frameHeight = camera.value("frame_height", device.camera.frameHeight);
    }
    return device;
}

}

CentralConfig loadCentralConfig(const std::string& path) {
    json config = readConfig(path);
    CentralConfig c;
    try {
        c.ip = config.value("ip", c.ip);
        c.port = portValue(config, "port", c.port);
        c.adminPort = portValue(config, "admin_port", c.adminPort);
        c.dataDir = config.value("data_dir", c.dataDir);
        c.logFile = config.value("log_file", c.logFile);
        c.logLevel = config.value("log_level", c.logLevel);
        c.ratePerMinute = config.value("rate_per_minute", c.ratePerMinute);
        c.minimumFee = config.value("minimum_fee", c.minimumFee);
        c.connectionTimeout = std::chrono::seconds(config.value("connection_timeout_s", 30));
    } catch (const json::type_error& e) {
        throw ConfigError("invalid value in " + path + ": " + e.what());
    }
    if (c.ratePerMinute < 0.0 || c.minimumFee < 0.0) {
        throw ConfigError("rate_per_minute and minimum_fee must not be negative");
    }
    checkLevel(c.logLevel);
    return c;
}

LaneNodeConfig loadLaneConfig(const std::string& path) {
    json config = readConfig(path);
    LaneNodeConfig c;
    try {
        c.centralIp = config.value("central_ip", c.centralIp);
        c.centralPort = portValue(config, "central_port", c.centralPort);
        std::string mode = config.value("mode", std::string("simulation"));
        if (mode != "simulation" && mode != "hardware") {
            throw ConfigError("mode must be simulation or hardware");
        }
        c.simulationMode = mode == "simulation";
        c.floor = config.value("floor", c.floor);
        c.confidenceMin = config.value("confidence_min", c.confidenceMin);
        c.passageTimeout = std::chrono::seconds(config.value("passage_timeout_s", 10));
        c.requestTimeout = std::chrono::seconds(config.value("request_timeout_s", 5));
        c.errorBackoff = std::chrono::seconds(config.value("error_backoff_s", 10));
        c.pollInterval = std::chrono::milliseconds(config.value("poll_interval_ms", 1000));
        c.gateTravel = std::chrono::milliseconds(config.value("gate_travel_ms", 2000));
        int slots = config.value("total_slots", 8);
        if (slots <= 0) {
            throw ConfigError("total_slots must be positive");
        }
        c.totalSlots = static_cast<std::size_t>(slots);
        c.logFile = config.value("log_file", c.logFile);
        c.logLevel = config.value("log_level", c.logLevel);
        c.statsInterval = std::chrono::seconds(config.value("stats_interval_s", 300));
        if (c.statsInterval.count() <= 0) {
            throw ConfigError("stats_interval_s must be positive");
        }
        c.gpioRoot = config.value("gpio_root", c.gpioRoot);
        c.entry = deviceConfig(config.value("entry", json::object()));
        c.exit = deviceConfig(config.value("exit", json::object()));

        c.simulation.gateTravel = c.gateTravel;
        if (config.contains("simulation")) {
            const json& sim = config["simulation"];
            c.simulation.presenceProbability = sim.value("presence_probability", c.simulation.presenceProbability);
            c.simulation.captureSuccessRate = sim.value("capture_success_rate", c.simulation.captureSuccessRate);
            c.simulation.minConfidence = sim.value("min_confidence", c.simulation.minConfidence);
            c.simulation.maxConfidence = sim.value("max_confidence", c.simulation.maxConfidence);
            c.simulation.captureDelayMin = std::chrono::milliseconds(sim.value("capture_delay_min_ms", 1000));
            c.simulation.captureDelayMax = std::chrono::milliseconds(sim.value("capture_delay_max_ms", 3000));
            c.simulation.passageAfter = std::chrono::milliseconds(sim.value("passage_after_ms", 3000));
            c.simulation.plates = sim.value("plates", c.simulation.plates);
            if (sim.contains("seed")) {
                c.simulation.seed = sim["seed"].get<unsigned int>();
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigError("invalid value in " + path + ": " + e.what());
    }
    if (c.confidenceMin < 0.0 || c.confidenceMin > 1.0) {
        throw ConfigError("confidence_min must be between 0 and 1");
    }
    if (c.simulation.minConfidence > c.simulation.maxConfidence) {
        throw ConfigError("simulation min_confidence exceeds max_confidence");
    }
    checkLevel(c.logLevel);
    return c;
}
