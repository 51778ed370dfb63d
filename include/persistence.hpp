#pragma once
#include "event.hpp"
#include "vehicle.hpp"
#include <string>

struct DailyStats {
    int entries = 0;
    int exits = 0;
    double revenue = 0.0;
};

// 事件与车辆记录的存储后端，失败时抛出 PersistenceError
class PersistenceStore {
public:
    virtual ~PersistenceStore() = default;

    // 追加一条事件记录，返回事件编号
    virtual std::string saveEvent(const Event& event) = 0;
    virtual void saveVehicle(const Vehicle& vehicle) = 0;
    // 按 车牌 + 入场时间 定位记录
    virtual void updateVehicle(const Vehicle& vehicle) = 0;
    // date 格式 YYYY-MM-DD
    virtual DailyStats queryDailyStats(const std::string& date) = 0;
};
