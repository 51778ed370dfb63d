#include "../include/slot_board.hpp"
#include "../include/logger.hpp"

SlotBoard::SlotBoard(std::size_t total, RefreshCallback onRefresh)
    : slots(total), freeCount(total), onRefresh(std::move(onRefresh)) {
    for (std::size_t i = 0; i < slots.size(); ++i) {
        slots[i].index = static_cast<int>(i);
    }
}

bool SlotBoard::occupyLocked(int index, const std::string& plate) {
    if (index < 0 || static_cast<std::size_t>(index) >= slots.size()) {
        Logger::logSystem(Logger::Level::Error, "slot_board", "Invalid slot number: " + std::to_string(index));
        return false;
    }
    Slot& slot = slots[index];
    if (slot.occupied) {
        Logger::logSystem(Logger::Level::Warning, "slot_board", "Slot " + std::to_string(index) + " already occupied");
        return false;
    }
    slot.occupied = true;
    slot.plate = plate;
    --freeCount;
    ++version;
    return true;
}

bool SlotBoard::freeLocked(int index) {
    if (index < 0 || static_cast<std::size_t>(index) >= slots.size()) {
        Logger::logSystem(Logger::Level::Error, "slot_board", "Invalid slot number: " + std::to_string(index));
        return false;
    }
    Slot& slot = slots[index];
    if (!slot.occupied) {
        Logger::logSystem(Logger::Level::Warning, "slot_board", "Slot " + std::to_string(index) + " already free");
        return false;
    }
    slot.occupied = false;
    slot.plate.clear();
    ++freeCount;
    ++version;
    return true;
}

bool SlotBoard::occupy(int index, const std::string& plate) {
    SlotStats snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!occupyLocked(index, plate)) return false;
        snapshot = statsLocked();
    }
    Logger::logSystem(Logger::Level::Info, "slot_board", "Slot " + std::to_string(index) + " occupied");
    refresh(snapshot);
    return true;
}

bool SlotBoard::free(int index) {
    SlotStats snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!freeLocked(index)) return false;
        snapshot = statsLocked();
    }
    Logger::logSystem(Logger::Level::Info, "slot_board", "Slot " + std::to_string(index) + " freed");
    refresh(snapshot);
    return true;
}

int SlotBoard::findFreeSlot() const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& slot : slots) {
        if (!slot.occupied) return slot.index;
    }
    return kNoSlot;
}

int SlotBoard::findSlotOf(const std::string& plate) const {
    if (plate.empty()) return kNoSlot;
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& slot : slots) {
        if (slot.occupied && slot.plate == plate) return slot.index;
    }
    return kNoSlot;
}

int SlotBoard::occupyFirstFree(const std::string& plate) {
    SlotStats snapshot;
    int index = kNoSlot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& slot : slots) {
            if (!slot.occupied) {
                index = slot.index;
                break;
            }
        }
        if (index == kNoSlot || !occupyLocked(index, plate)) return kNoSlot;
        snapshot = statsLocked();
    }
    Logger::logVehicle(plate, "slot_occupied", "Slot " + std::to_string(index));
    refresh(snapshot);
    return index;
}

int SlotBoard::releaseVehicle(const std::string& plate) {
    SlotStats snapshot;
    int index = kNoSlot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& slot : slots) {
            if (slot.occupied && !plate.empty() && slot.plate == plate) {
                index = slot.index;
                break;
            }
        }
        if (index == kNoSlot) {
            for (const auto& slot : slots) {
                if (slot.occupied) {
                    index = slot.index;
                    break;
                }
            }
        }
        if (index == kNoSlot || !freeLocked(index)) return kNoSlot;
        snapshot = statsLocked();
    }
    Logger::logVehicle(plate, "slot_freed", "Slot " + std::to_string(index));
    refresh(snapshot);
    return index;
}

SlotStats SlotBoard::statsLocked() const {
    SlotStats s;
    s.total = slots.size();
    s.free = freeCount;
    s.occupied = s.total - s.free;
    s.occupiedPercent = s.total == 0 ? 0.0 : static_cast<double>(s.occupied) * 100.0 / static_cast<double>(s.total);
    s.full = s.free == 0;
    s.version = version;
    for (const auto& slot : slots) {
        (slot.occupied ? s.occupiedSlots : s.freeSlots).push_back(slot.index);
    }
    return s;
}

SlotStats SlotBoard::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    return statsLocked();
}

void SlotBoard::refresh(const SlotStats& snapshot) {
    if (!onRefresh) return;
    std::lock_guard<std::mutex> lock(refreshMutex);
    // 并发变更时较新的快照可能先到
    if (snapshot.version <= lastDelivered) return;
    lastDelivered = snapshot.version;
    onRefresh(snapshot);
}
