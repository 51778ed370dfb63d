#pragma once
#include "../include/errors.hpp"
#include "../include/persistence.hpp"
#include "../include/protocol.hpp"
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// 测试用临时目录，析构时整体删除
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "garage_test_XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        dir = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return dir.string(); }
    std::string file(const std::string& name) const { return (dir / name).string(); }

private:
    std::filesystem::path dir;
};

// 内存存储，可模拟写入失败
class MemoryStore : public PersistenceStore {
public:
    std::string saveEvent(const Event& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWrites) throw PersistenceError("disk full");
        events.push_back(event);
        events.back().id = std::to_string(events.size());
        return *events.back().id;
    }
    void saveVehicle(const Vehicle& vehicle) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWrites) throw PersistenceError("disk full");
        vehicles.push_back(vehicle);
    }
    void updateVehicle(const Vehicle& vehicle) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWrites) throw PersistenceError("disk full");
        for (auto& v : vehicles) {
            if (v.plate == vehicle.plate && v.entryTime == vehicle.entryTime) {
                v = vehicle;
                return;
            }
        }
        throw PersistenceError("no record for " + vehicle.plate);
    }
    DailyStats queryDailyStats(const std::string& date) override {
        std::lock_guard<std::mutex> lock(mutex);
        DailyStats stats;
        for (const auto& e : events) {
            if (e.timestamp.substr(0, 10) != date || e.status != EventStatus::Completed) continue;
            if (e.kind == EventKind::Entry) ++stats.entries;
            if (e.kind == EventKind::Exit) {
                ++stats.exits;
                stats.revenue += e.fee.value_or(0.0);
            }
        }
        return stats;
    }

    std::mutex mutex;
    std::vector<Event> events;
    std::vector<Vehicle> vehicles;
    bool failWrites = false;
};

inline Event makeEvent(const std::string& plate, EventKind kind, const std::string& timestamp,
                       const std::string& floor = "terreo") {
    Event event;
    event.plate = plate;
    event.kind = kind;
    event.timestamp = timestamp;
    event.confidence = 0.95;
    event.floor = floor;
    return event;
}
