#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/protocol.hpp"
#include "../include/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

Database::Database(const std::string& dataDir) {
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        throw PersistenceError("cannot create data directory " + dataDir + ": " + ec.message());
    }
    eventsPath = (fs::path(dataDir) / "events.jsonl").string();
    vehiclesPath = (fs::path(dataDir) / "vehicles.json").string();
    usersPath = (fs::path(dataDir) / "users.json").string();

    // 事件编号接着已有记录继续递增
    for (const auto& line : readEventLines()) {
        if (!line.is_object()) continue;
        long long id = 0;
        try {
            id = std::stoll(line.value("id", std::string("0")));
        } catch (const std::exception&) {
            continue;
        }
        if (id >= nextEventId) nextEventId = id + 1;
    }
}

json Database::readJson(const std::string& filename, const json& fallback) {
    std::ifstream file(filename);
    if (!file.good()) return fallback;
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        Logger::logSystem(Logger::Level::Error, "database", filename + " is corrupted: " + e.what());
        return fallback;
    }
}

json Database::loadVehicleList() {
    json vehicles = readJson(vehiclesPath, json::array());
    if (!vehicles.is_array()) {
        throw PersistenceError(vehiclesPath + " does not hold a vehicle list");
    }
    return vehicles;
}

bool Database::writeJson(const std::string& filename, const json& data) {
    // 先写临时文件再改名，避免写到一半留下残缺文件
    std::string tmp = filename + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) return false;
        file << data.dump(4);
        if (!file.good()) return false;
    }
    std::error_code ec;
    fs::rename(tmp, filename, ec);
    return !ec;
}

std::vector<json> Database::readEventLines() {
    std::vector<json> lines;
    std::ifstream file(eventsPath);
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        try {
            json record = json::parse(line);
            if (!record.is_object()) {
                Logger::logSystem(Logger::Level::Warning, "database", "Skipping non-object event line");
                continue;
            }
            lines.push_back(record);
        } catch (const json::parse_error& e) {
            Logger::logSystem(Logger::Level::Warning, "database", "Skipping corrupted event line: " + std::string(e.what()));
        }
    }
    return lines;
}

std::string Database::saveEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(eventsMutex);
    std::string id = std::to_string(nextEventId);
    json record = protocol::encodeEvent(event);
    record["id"] = id;

    std::ofstream file(eventsPath, std::ios::app);
    if (!file) {
        throw PersistenceError("cannot open " + eventsPath);
    }
    file << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    file.flush();
    if (!file.good()) {
        throw PersistenceError("cannot append to " + eventsPath);
    }
    ++nextEventId;
    Logger::logSystem(Logger::Level::Debug, "database", "Event " + id + " saved");
    return id;
}

void Database::saveVehicle(const Vehicle& vehicle) {
    std::lock_guard<std::mutex> lock(vehiclesMutex);
    json vehicles = loadVehicleList();
    vehicles.push_back(vehicle);
    bool written = false;
    try {
        written = writeJson(vehiclesPath, vehicles);
    } catch (const json::exception& e) {
        throw PersistenceError("cannot encode " + vehiclesPath + ": " + e.what());
    }
    if (!written) {
        throw PersistenceError("cannot write " + vehiclesPath);
    }
}

void Database::updateVehicle(const Vehicle& vehicle) {
    std::lock_guard<std::mutex> lock(vehiclesMutex);
    json vehicles = loadVehicleList();
    bool found = false;
    for (auto& record : vehicles) {
        if (!record.is_object()) continue;
        if (record.value("placa", std::string()) == vehicle.plate &&
            record.value("timestamp_entrada", std::string()) == vehicle.entryTime) {
            record = vehicle;
            found = true;
            break;
        }
    }
    if (!found) {
        throw PersistenceError("no vehicle record for " + vehicle.plate + " entered at " + vehicle.entryTime);
    }
    bool written = false;
    try {
        written = writeJson(vehiclesPath, vehicles);
    } catch (const json::exception& e) {
        throw PersistenceError("cannot encode " + vehiclesPath + ": " + e.what());
    }
    if (!written) {
        throw PersistenceError("cannot write " + vehiclesPath);
    }
}

DailyStats Database::queryDailyStats(const std::string& date) {
    std::lock_guard<std::mutex> lock(eventsMutex);
    DailyStats stats;
    for (const auto& record : readEventLines()) {
        if (utils::dateOf(record.value("timestamp", std::string())) != date) continue;
        if (record.value("status", std::string()) != toString(EventStatus::Completed)) continue;

        std::string kind = record.value("tipo", std::string());
        if (kind == toString(EventKind::Entry)) {
            ++stats.entries;
        } else if (kind == toString(EventKind::Exit)) {
            ++stats.exits;
            if (record.contains("valor_calculado") && record["valor_calculado"].is_number()) {
                stats.revenue += record["valor_calculado"].get<double>();
            }
        }
    }
    return stats;
}

std::vector<Vehicle> Database::loadParkedVehicles() {
    std::lock_guard<std::mutex> lock(vehiclesMutex);
    std::vector<Vehicle> parked;
    json vehicles = readJson(vehiclesPath, json::array());
    if (!vehicles.is_array()) {
        Logger::logSystem(Logger::Level::Error, "database", vehiclesPath + " does not hold a vehicle list");
        return parked;
    }
    for (const auto& record : vehicles) {
        try {
            Vehicle v = record.get<Vehicle>();
            if (v.status == VehicleStatus::Parked) parked.push_back(v);
        } catch (const std::exception& e) {
            Logger::logSystem(Logger::Level::Warning, "database", "Skipping invalid vehicle record: " + std::string(e.what()));
        }
    }
    return parked;
}

std::vector<Event> Database::getEvents() {
    std::lock_guard<std::mutex> lock(eventsMutex);
    std::vector<Event> events;
    for (const auto& record : readEventLines()) {
        try {
            Event event = protocol::decodeEvent(record);
            event.id = record.value("id", std::string());
            events.push_back(event);
        } catch (const ProtocolError& e) {
            Logger::logSystem(Logger::Level::Warning, "database", "Skipping invalid event record: " + std::string(e.what()));
        }
    }
    return events;
}

json Database::getVehicles() {
    std::lock_guard<std::mutex> lock(vehiclesMutex);
    return readJson(vehiclesPath, json::array());
}

json Database::getUsers() {
    std::lock_guard<std::mutex> lock(usersMutex);
    return readJson(usersPath, json::array());
}

bool Database::saveUsers(const json& data) {
    std::lock_guard<std::mutex> lock(usersMutex);
    return writeJson(usersPath, data);
}
