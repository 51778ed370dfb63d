#include "../include/utils.hpp"
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

// 计算SHA256哈希值
std::string utils::sha256(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, input.c_str(), input.size());
    SHA256_Final(hash, &sha256);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// 获取当前时间的ISO格式字符串（本地时间，不带时区）
std::string utils::getCurrentTimeISO() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

// 时间点按 UTC 字段格式化，与 isoStringToTime 互逆
std::string utils::timeToISO(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

// 将ISO格式字符串转换为时间点
// 不带时区的时间按字段原样换算，两端一致即可得到正确的时间差
utils::TimePoint utils::isoStringToTime(const std::string& iso) {
    if (iso.size() < 19) {
        throw std::invalid_argument("invalid timestamp: " + iso);
    }
    std::string head = iso.substr(0, 19);
    if (head[10] == ' ') head[10] = 'T';

    std::tm tm = {};
    std::istringstream ss(head);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("invalid timestamp: " + iso);
    }
    // 超出范围的年份换算成微秒会溢出
    int year = tm.tm_year + 1900;
    if (year < 1970 || year > 2200) {
        throw std::invalid_argument("timestamp out of range: " + iso);
    }
    time_t seconds = timegm(&tm);

    std::size_t pos = 19;
    long long micros = 0;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (iso[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("invalid timestamp: " + iso);
        }
        for (; digits < 6; ++digits) micros *= 10;
    }

    long offsetSeconds = 0;
    if (pos < iso.size()) {
        char sign = iso[pos];
        if (sign == 'Z' && pos + 1 == iso.size()) {
            offsetSeconds = 0;
        } else if ((sign == '+' || sign == '-') && iso.size() == pos + 6 && iso[pos + 3] == ':') {
            int hh = std::stoi(iso.substr(pos + 1, 2));
            int mm = std::stoi(iso.substr(pos + 4, 2));
            offsetSeconds = (hh * 3600L + mm * 60L) * (sign == '+' ? 1 : -1);
        } else {
            throw std::invalid_argument("invalid timestamp: " + iso);
        }
    }

    return std::chrono::system_clock::from_time_t(seconds - offsetSeconds)
        + std::chrono::microseconds(micros);
}

// 计算两个ISO格式时间字符串之间的时间差
std::chrono::microseconds utils::elapsed(const std::string& start, const std::string& end) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        isoStringToTime(end) - isoStringToTime(start));
}

// 按分钟计费，不足一分钟按一分钟计
int utils::billedMinutes(std::chrono::microseconds elapsed) {
    if (elapsed.count() <= 0) return 0;
    const long long perMinute = 60LL * 1000 * 1000;
    long long minutes = elapsed.count() / perMinute;
    if (elapsed.count() % perMinute != 0) ++minutes;
    return static_cast<int>(minutes);
}

std::string utils::dateOf(const std::string& iso) {
    return iso.substr(0, 10);
}

// 车牌格式：3个大写字母 + 4个数字
bool utils::isValidPlate(const std::string& plate) {
    if (plate.size() != 7) return false;
    for (int i = 0; i < 3; ++i) {
        if (!std::isupper(static_cast<unsigned char>(plate[i]))) return false;
    }
    for (int i = 3; i < 7; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(plate[i]))) return false;
    }
    return true;
}
