#pragma once
#include "event.hpp"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// 一行一个 JSON 对象，以 '\n' 结尾；每个连接一问一答后关闭
namespace protocol {
    constexpr std::size_t kMaxLineLength = 64 * 1024;

    json encodeEvent(const Event& event);
    json encodeResponse(const EventResponse& response);

    // 字段缺失、类型错误或枚举取值未知时抛出 ProtocolError
    Event decodeEvent(const json& j);
    EventResponse decodeResponse(const json& j);

    std::string toLine(const json& j);
    // 非法 JSON 抛出 ProtocolError
    json parseLine(const std::string& line);
}
