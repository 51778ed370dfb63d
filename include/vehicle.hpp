#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class VehicleStatus { Parked, Departed, Blocked };

std::string toString(VehicleStatus status);
VehicleStatus vehicleStatusFromString(const std::string& value);

// 计费规则：按分钟计价，低于最低收费按最低收费
struct Tariff {
    double ratePerMinute = 0.15;
    double minimumFee = 2.00;

    double feeFor(int minutes) const;
};

struct Vehicle {
    std::string plate;
    std::string entryTime;
    std::optional<std::string> exitTime;
    std::string floor = "terreo";
    std::optional<int> slot;
    VehicleStatus status = VehicleStatus::Parked;
    std::optional<double> fee;
    std::optional<int> durationMinutes;

    Vehicle() = default;
    Vehicle(const std::string& plate, const std::string& entryTime, const std::string& floor);

    // 登记出场：写入出场时间、停车时长和费用，状态变为 Departed
    void checkout(const std::string& time, const Tariff& tariff);
};

void to_json(nlohmann::json& j, const Vehicle& v);
void from_json(const nlohmann::json& j, Vehicle& v);
