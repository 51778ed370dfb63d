#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct Slot {
    int index = 0;
    bool occupied = false;
    std::string plate;  // 占用该车位的车牌，未知时为空
};

struct SlotStats {
    std::size_t total = 0;
    std::size_t free = 0;
    std::size_t occupied = 0;
    double occupiedPercent = 0.0;
    bool full = false;
    std::vector<int> occupiedSlots;
    std::vector<int> freeSlots;
    std::uint64_t version = 0;  // 每次变更加一
};

/**
 * 车位占用表，入口和出口车道共享。
 * 每次变更后 occupied + free == total，并通过回调刷新车位显示屏。
 * 回调按 version 递增的顺序串行调用，过时的快照直接丢弃；回调内不能修改车位表。
 */
class SlotBoard {
public:
    static constexpr int kNoSlot = -1;
    using RefreshCallback = std::function<void(const SlotStats&)>;

    explicit SlotBoard(std::size_t total, RefreshCallback onRefresh = nullptr);

    SlotBoard(const SlotBoard&) = delete;
    SlotBoard& operator=(const SlotBoard&) = delete;

    // 越界或已占用时不做任何修改并返回 false
    bool occupy(int index, const std::string& plate = "");
    // 越界或本就空闲时不做任何修改并返回 false
    bool free(int index);

    int findFreeSlot() const;
    int findSlotOf(const std::string& plate) const;

    // 占用编号最小的空闲车位，返回车位号，已满返回 kNoSlot
    int occupyFirstFree(const std::string& plate);
    // 释放该车牌绑定的车位；没有绑定时释放找到的第一个已占用车位
    int releaseVehicle(const std::string& plate);

    SlotStats stats() const;
    std::size_t total() const { return slots.size(); }

private:
    std::vector<Slot> slots;
    std::size_t freeCount;
    std::uint64_t version = 0;
    RefreshCallback onRefresh;
    mutable std::mutex mutex;

    std::mutex refreshMutex;
    std::uint64_t lastDelivered = 0;

    bool occupyLocked(int index, const std::string& plate);
    bool freeLocked(int index);
    SlotStats statsLocked() const;
    void refresh(const SlotStats& snapshot);
};
