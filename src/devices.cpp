#include "../include/devices.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <thread>

SimulatedGate::SimulatedGate(const std::string& name, const SimulationSettings& settings)
    : name(name), travel(settings.gateTravel), passageAfter(settings.passageAfter) {}

bool SimulatedGate::open() {
    Logger::logSystem(Logger::Level::Info, name, "Opening gate (simulation)");
    std::this_thread::sleep_for(travel);
    std::lock_guard<std::mutex> lock(mutex);
    opened = true;
    openedAt = std::chrono::steady_clock::now();
    return true;
}

bool SimulatedGate::close() {
    Logger::logSystem(Logger::Level::Info, name, "Closing gate (simulation)");
    std::this_thread::sleep_for(travel);
    std::lock_guard<std::mutex> lock(mutex);
    opened = false;
    return true;
}

// 闸门打开 passageAfter 之后视为车辆已通过
bool SimulatedGate::sensePassage(std::chrono::milliseconds timeout) {
    std::chrono::steady_clock::time_point passAt;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!opened) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        passAt = openedAt + passageAfter;
    }
    auto now = std::chrono::steady_clock::now();
    if (passAt <= now) return true;
    if (passAt - now > timeout) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::this_thread::sleep_until(passAt);
    return true;
}

bool SimulatedGate::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex);
    return opened;
}

SimulatedPresenceSensor::SimulatedPresenceSensor(const std::string& name, const SimulationSettings& settings)
    : name(name), probability(settings.presenceProbability), rng(settings.seed) {}

bool SimulatedPresenceSensor::detect() {
    std::bernoulli_distribution present(probability);
    bool detected = present(rng);
    if (detected) {
        Logger::logSystem(Logger::Level::Debug, name, "Vehicle detected (simulation)");
    }
    return detected;
}

SimulatedPlateCapture::SimulatedPlateCapture(const SimulationSettings& settings)
    : settings(settings), rng(settings.seed + 1) {}

PlateReading SimulatedPlateCapture::capture() {
    auto lo = settings.captureDelayMin.count();
    auto hi = std::max(lo, settings.captureDelayMax.count());
    std::uniform_int_distribution<long long> delay(lo, hi);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay(rng)));

    PlateReading reading;
    std::bernoulli_distribution success(settings.captureSuccessRate);
    if (settings.plates.empty() || !success(rng)) {
        Logger::logSystem(Logger::Level::Warning, "lpr", "Plate capture failed (simulation)");
        return reading;
    }
    std::uniform_int_distribution<std::size_t> pick(0, settings.plates.size() - 1);
    std::uniform_real_distribution<double> confidence(settings.minConfidence, settings.maxConfidence);
    reading.plate = settings.plates[pick(rng)];
    reading.confidence = confidence(rng);
    Logger::logVehicle(*reading.plate, "capture", "Plate captured (simulation), confidence " +
                       std::to_string(reading.confidence));
    return reading;
}
