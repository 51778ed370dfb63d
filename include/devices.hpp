#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct PlateReading {
    std::optional<std::string> plate;
    double confidence = 0.0;
};

// 车道硬件接口，车道状态机只依赖这三个抽象
class GateDriver {
public:
    virtual ~GateDriver() = default;
    virtual bool open() = 0;
    virtual bool close() = 0;
    // 在 timeout 内检测到车辆通过返回 true
    virtual bool sensePassage(std::chrono::milliseconds timeout) = 0;
};

class PresenceSensor {
public:
    virtual ~PresenceSensor() = default;
    virtual bool detect() = 0;
};

class PlateCapture {
public:
    virtual ~PlateCapture() = default;
    virtual PlateReading capture() = 0;
};

struct SimulationSettings {
    double presenceProbability = 0.3;
    double captureSuccessRate = 0.9;
    double minConfidence = 0.7;
    double maxConfidence = 0.98;
    std::chrono::milliseconds captureDelayMin{1000};
    std::chrono::milliseconds captureDelayMax{3000};
    std::chrono::milliseconds gateTravel{2000};
    std::chrono::milliseconds passageAfter{3000};
    std::vector<std::string> plates = {
        "ABC1234", "DEF5678", "GHI9012", "JKL3456", "MNO7890",
        "PQR1234", "STU5678", "VWX9012", "YZA3456", "BCD7890"
    };
    unsigned int seed = std::random_device{}();
};

class SimulatedGate : public GateDriver {
public:
    SimulatedGate(const std::string& name, const SimulationSettings& settings);
    bool open() override;
    bool close() override;
    bool sensePassage(std::chrono::milliseconds timeout) override;
    bool isOpen() const;

private:
    std::string name;
    std::chrono::milliseconds travel;
    std::chrono::milliseconds passageAfter;
    mutable std::mutex mutex;
    bool opened = false;
    std::chrono::steady_clock::time_point openedAt;
};

class SimulatedPresenceSensor : public PresenceSensor {
public:
    SimulatedPresenceSensor(const std::string& name, const SimulationSettings& settings);
    bool detect() override;

private:
    std::string name;
    double probability;
    std::mt19937 rng;
};

class SimulatedPlateCapture : public PlateCapture {
public:
    explicit SimulatedPlateCapture(const SimulationSettings& settings);
    PlateReading capture() override;

private:
    SimulationSettings settings;
    std::mt19937 rng;
};
