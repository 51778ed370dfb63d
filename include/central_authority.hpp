#pragma once
#include "event.hpp"
#include "persistence.hpp"
#include "vehicle.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// 管理员开关：停车场关闭、楼层封锁
struct AdminFlags {
    bool garageClosed = false;
    std::optional<std::string> blockedFloor;
};

struct AuthorityStats {
    std::size_t parkedVehicles = 0;
    AdminFlags flags;
    DailyStats today;
};

/**
 * 中央服务器的业务核心。
 * 在场车辆表、管理员开关和持久化写入都在同一个互斥锁内完成，
 * 同一车牌的两个并发入场请求只有一个能成功。
 */
class CentralAuthority {
public:
    CentralAuthority(PersistenceStore& store, Tariff tariff);

    CentralAuthority(const CentralAuthority&) = delete;
    CentralAuthority& operator=(const CentralAuthority&) = delete;

    EventResponse processEvent(Event event);

    // 传输层入口：一行请求对应一行答复，非法 JSON 抛出 ProtocolError
    std::string handleRequest(const std::string& line);

    void closeGarage();
    void openGarage();
    void blockFloor(const std::string& floor);
    void unblockFloor();

    // 启动时恢复上次未出场的车辆
    void restore(const std::vector<Vehicle>& parked);

    AdminFlags flags() const;
    bool isParked(const std::string& plate) const;
    std::vector<Vehicle> parkedVehicles() const;
    AuthorityStats stats(const std::string& date) const;
    const Tariff& tariff() const { return rates; }

private:
    PersistenceStore& store;
    Tariff rates;
    std::map<std::string, Vehicle> parked;
    AdminFlags adminFlags;
    mutable std::mutex mutex;
    std::atomic<unsigned long> localSequence{0};

    EventResponse processEntry(Event& event);
    EventResponse processExit(Event& event);
    EventResponse deny(Event& event, GateAction action, const std::string& message);

    std::string persistEvent(const Event& event);
    void persistVehicle(const Vehicle& vehicle, bool update);
    std::string localEventId();
};
