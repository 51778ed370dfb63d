#include "../include/vehicle.hpp"
#include "../include/utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string toString(VehicleStatus status) {
    switch (status) {
        case VehicleStatus::Parked: return "estacionado";
        case VehicleStatus::Departed: return "saiu";
        case VehicleStatus::Blocked: return "bloqueado";
    }
    return "estacionado";
}

VehicleStatus vehicleStatusFromString(const std::string& value) {
    if (value == "estacionado") return VehicleStatus::Parked;
    if (value == "saiu") return VehicleStatus::Departed;
    if (value == "bloqueado") return VehicleStatus::Blocked;
    throw std::invalid_argument("unknown vehicle status: " + value);
}

double Tariff::feeFor(int minutes) const {
    double fee = std::max(minutes * ratePerMinute, minimumFee);
    // 保留两位小数
    return std::round(fee * 100.0) / 100.0;
}

Vehicle::Vehicle(const std::string& plate, const std::string& entryTime, const std::string& floor)
    : plate(plate), entryTime(entryTime), floor(floor) {}

void Vehicle::checkout(const std::string& time, const Tariff& tariff) {
    auto stay = utils::elapsed(entryTime, time);
    // 出场时间早于入场时间时按入场时间结算
    if (stay.count() < 0) {
        exitTime = entryTime;
        stay = std::chrono::microseconds(0);
    } else {
        exitTime = time;
    }
    durationMinutes = utils::billedMinutes(stay);
    fee = tariff.feeFor(*durationMinutes);
    status = VehicleStatus::Departed;
}

void to_json(nlohmann::json& j, const Vehicle& v) {
    j = {
        {"placa", v.plate},
        {"timestamp_entrada", v.entryTime},
        {"timestamp_saida", v.exitTime ? nlohmann::json(*v.exitTime) : nlohmann::json(nullptr)},
        {"andar", v.floor},
        {"vaga", v.slot ? nlohmann::json(*v.slot) : nlohmann::json(nullptr)},
        {"status", toString(v.status)},
        {"valor_calculado", v.fee ? nlohmann::json(*v.fee) : nlohmann::json(nullptr)},
        {"tempo_permanencia_minutos",
         v.durationMinutes ? nlohmann::json(*v.durationMinutes) : nlohmann::json(nullptr)}
    };
}

void from_json(const nlohmann::json& j, Vehicle& v) {
    v.plate = j.at("placa").get<std::string>();
    v.entryTime = j.at("timestamp_entrada").get<std::string>();
    v.floor = j.value("andar", std::string("terreo"));
    v.status = vehicleStatusFromString(j.value("status", std::string("estacionado")));

    v.exitTime.reset();
    v.slot.reset();
    v.fee.reset();
    v.durationMinutes.reset();
    if (j.contains("timestamp_saida") && !j["timestamp_saida"].is_null()) {
        v.exitTime = j["timestamp_saida"].get<std::string>();
    }
    if (j.contains("vaga") && !j["vaga"].is_null()) {
        v.slot = j["vaga"].get<int>();
    }
    if (j.contains("valor_calculado") && !j["valor_calculado"].is_null()) {
        v.fee = j["valor_calculado"].get<double>();
    }
    if (j.contains("tempo_permanencia_minutos") && !j["tempo_permanencia_minutos"].is_null()) {
        v.durationMinutes = j["tempo_permanencia_minutos"].get<int>();
    }
}
