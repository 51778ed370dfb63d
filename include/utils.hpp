#pragma once
#include <string>
#include <ctime>
#include <chrono>

namespace utils {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string sha256(const std::string& input);
    std::string getCurrentTimeISO();
    std::string timeToISO(TimePoint tp);
    // 支持 YYYY-MM-DDTHH:MM:SS[.ffffff][Z|±HH:MM]，格式错误抛出 std::invalid_argument
    TimePoint isoStringToTime(const std::string& iso);
    std::chrono::microseconds elapsed(const std::string& start, const std::string& end);
    int billedMinutes(std::chrono::microseconds elapsed);
    std::string dateOf(const std::string& iso);
    bool isValidPlate(const std::string& plate);
}
