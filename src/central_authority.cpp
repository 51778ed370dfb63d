#include "../include/central_authority.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/protocol.hpp"
#include "../include/utils.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

CentralAuthority::CentralAuthority(PersistenceStore& store, Tariff tariff)
    : store(store), rates(tariff) {}

EventResponse CentralAuthority::processEvent(Event event) {
    std::lock_guard<std::mutex> lock(mutex);
    try {
        Logger::logVehicle(event.plate, toString(event.kind), "Processing event from floor " + event.floor);

        bool isExit = event.kind == EventKind::Exit;
        GateAction denial = isExit ? GateAction::DenyExit : GateAction::DenyEntry;
        if (adminFlags.garageClosed) {
            return deny(event, denial, "Garage closed");
        }
        if (adminFlags.blockedFloor && *adminFlags.blockedFloor == event.floor) {
            return deny(event, denial, "Floor blocked");
        }

        switch (event.kind) {
            case EventKind::Entry:
                return processEntry(event);
            case EventKind::Exit:
                return processExit(event);
            default:
                break;
        }

        std::string message = "Unsupported event type: " + toString(event.kind);
        event.status = EventStatus::Error;
        event.errorDescription = message;
        EventResponse response;
        response.eventId = persistEvent(event);
        response.success = false;
        response.action = GateAction::Error;
        response.message = message;
        Logger::logVehicle(event.plate, toString(event.kind), message, Logger::Level::Warning);
        return response;
    } catch (const std::exception& e) {
        // 时间戳无法解析等输入错误，答复 erro，在场车辆表不变
        Logger::logVehicle(event.plate, toString(event.kind), std::string("Failed to process event: ") + e.what(),
                           Logger::Level::Error);
        EventResponse response;
        response.eventId = localEventId();
        response.success = false;
        response.action = GateAction::Error;
        response.message = e.what();
        return response;
    }
}

EventResponse CentralAuthority::processEntry(Event& event) {
    if (parked.count(event.plate) != 0) {
        return deny(event, GateAction::DenyEntry, "Vehicle already parked");
    }

    // 先校验时间戳，避免把无法结算的记录放进在场表
    utils::isoStringToTime(event.timestamp);
    Vehicle vehicle(event.plate, event.timestamp, event.floor);
    parked.emplace(event.plate, vehicle);

    event.status = EventStatus::Completed;
    EventResponse response;
    response.eventId = persistEvent(event);
    persistVehicle(vehicle, false);
    response.success = true;
    response.action = GateAction::OpenGate;
    response.message = "Entry authorized";

    Logger::logVehicle(event.plate, "entry", "Entry authorized");
    return response;
}

EventResponse CentralAuthority::processExit(Event& event) {
    auto it = parked.find(event.plate);
    if (it == parked.end()) {
        return deny(event, GateAction::DenyExit, "Vehicle not parked");
    }

    Vehicle vehicle = it->second;
    vehicle.checkout(event.timestamp, rates);
    parked.erase(it);

    event.fee = vehicle.fee;
    event.durationMinutes = vehicle.durationMinutes;
    event.status = EventStatus::Completed;

    EventResponse response;
    response.eventId = persistEvent(event);
    persistVehicle(vehicle, true);

    std::ostringstream msg;
    msg << "Amount due: R$ " << std::fixed << std::setprecision(2) << *vehicle.fee;
    response.success = true;
    response.action = GateAction::Charge;
    response.fee = vehicle.fee;
    response.durationMinutes = vehicle.durationMinutes;
    response.message = msg.str();

    Logger::logVehicle(event.plate, "exit",
                       "Exit authorized - " + std::to_string(*vehicle.durationMinutes) + " min - " + msg.str());
    return response;
}

EventResponse CentralAuthority::deny(Event& event, GateAction action, const std::string& message) {
    event.status = EventStatus::Error;
    event.errorDescription = message;

    EventResponse response;
    response.eventId = persistEvent(event);
    response.success = false;
    response.action = action;
    response.message = message;

    Logger::logVehicle(event.plate, toString(event.kind), "Denied: " + message, Logger::Level::Warning);
    return response;
}

std::string CentralAuthority::persistEvent(const Event& event) {
    try {
        std::string id = store.saveEvent(event);
        if (!id.empty()) return id;
        Logger::logSystem(Logger::Level::Warning, "central", "Store returned no event id");
    } catch (const std::exception& e) {
        Logger::logSystem(Logger::Level::Error, "central", std::string("Failed to save event: ") + e.what());
    }
    return localEventId();
}

void CentralAuthority::persistVehicle(const Vehicle& vehicle, bool update) {
    try {
        if (update) {
            store.updateVehicle(vehicle);
        } else {
            store.saveVehicle(vehicle);
        }
    } catch (const std::exception& e) {
        Logger::logSystem(Logger::Level::Error, "central",
                          std::string(update ? "Failed to update vehicle " : "Failed to save vehicle ") +
                          vehicle.plate + ": " + e.what());
    }
}

std::string CentralAuthority::localEventId() {
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "evt_" + std::to_string(now) + "_" + std::to_string(++localSequence);
}

std::string CentralAuthority::handleRequest(const std::string& line) {
    json request = protocol::parseLine(line);

    EventResponse response;
    try {
        response = processEvent(protocol::decodeEvent(request));
    } catch (const ProtocolError& e) {
        Logger::logSystem(Logger::Level::Warning, "central", e.what());
        response.eventId = localEventId();
        response.success = false;
        response.action = GateAction::Error;
        response.message = e.what();
    }
    return protocol::toLine(protocol::encodeResponse(response));
}

void CentralAuthority::closeGarage() {
    std::lock_guard<std::mutex> lock(mutex);
    adminFlags.garageClosed = true;
    Logger::logSystem(Logger::Level::Info, "central", "Garage closed");
}

void CentralAuthority::openGarage() {
    std::lock_guard<std::mutex> lock(mutex);
    adminFlags.garageClosed = false;
    Logger::logSystem(Logger::Level::Info, "central", "Garage opened");
}

void CentralAuthority::blockFloor(const std::string& floor) {
    std::lock_guard<std::mutex> lock(mutex);
    adminFlags.blockedFloor = floor;
    Logger::logSystem(Logger::Level::Info, "central", "Floor " + floor + " blocked");
}

void CentralAuthority::unblockFloor() {
    std::lock_guard<std::mutex> lock(mutex);
    adminFlags.blockedFloor.reset();
    Logger::logSystem(Logger::Level::Info, "central", "Floor unblocked");
}

void CentralAuthority::restore(const std::vector<Vehicle>& vehicles) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& v : vehicles) {
        if (v.status != VehicleStatus::Parked) continue;
        if (!parked.emplace(v.plate, v).second) {
            Logger::logVehicle(v.plate, "restore", "Duplicate parked record ignored", Logger::Level::Warning);
        }
    }
    Logger::logSystem(Logger::Level::Info, "central", "Restored " + std::to_string(parked.size()) + " parked vehicles");
}

AdminFlags CentralAuthority::flags() const {
    std::lock_guard<std::mutex> lock(mutex);
    return adminFlags;
}

bool CentralAuthority::isParked(const std::string& plate) const {
    std::lock_guard<std::mutex> lock(mutex);
    return parked.count(plate) != 0;
}

std::vector<Vehicle> CentralAuthority::parkedVehicles() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Vehicle> result;
    result.reserve(parked.size());
    for (const auto& [plate, vehicle] : parked) {
        result.push_back(vehicle);
    }
    return result;
}

AuthorityStats CentralAuthority::stats(const std::string& date) const {
    AuthorityStats s;
    {
        std::lock_guard<std::mutex> lock(mutex);
        s.parkedVehicles = parked.size();
        s.flags = adminFlags;
    }
    // 查询存储时不持有锁
    try {
        s.today = store.queryDailyStats(date);
    } catch (const std::exception& e) {
        Logger::logSystem(Logger::Level::Error, "central", std::string("Failed to query daily stats: ") + e.what());
    }
    return s;
}
