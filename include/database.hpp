#pragma once
#include "persistence.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <fstream>

using json = nlohmann::json;

/**
 * JSON 文件存储：
 *   events.jsonl  每行一条事件，只追加
 *   vehicles.json 停车记录数组，出场时更新一次
 *   users.json    管理员账号
 */
class Database : public PersistenceStore {
public:
    explicit Database(const std::string& dataDir);

    std::string saveEvent(const Event& event) override;
    void saveVehicle(const Vehicle& vehicle) override;
    void updateVehicle(const Vehicle& vehicle) override;
    DailyStats queryDailyStats(const std::string& date) override;

    std::vector<Vehicle> loadParkedVehicles();
    std::vector<Event> getEvents();
    json getVehicles();

    json getUsers();
    bool saveUsers(const json& data);

private:
    std::string eventsPath;
    std::string vehiclesPath;
    std::string usersPath;
    long long nextEventId = 1;

    std::mutex usersMutex;
    std::mutex vehiclesMutex;
    std::mutex eventsMutex;

    json readJson(const std::string& filename, const json& fallback);
    bool writeJson(const std::string& filename, const json& data);
    // 读取车辆列表，根节点不是数组时抛出 PersistenceError
    json loadVehicleList();
    std::vector<json> readEventLines();
};
