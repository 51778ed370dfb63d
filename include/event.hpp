#pragma once
#include <string>
#include <optional>

enum class EventKind { Entry, Exit, Error, Maintenance };
enum class EventStatus { Pending, Processing, Completed, Error };
enum class GateAction { OpenGate, Charge, DenyEntry, DenyExit, Error };

// 车道的一次通行尝试
struct Event {
    std::optional<std::string> id;
    std::string plate;
    EventKind kind = EventKind::Entry;
    std::string timestamp;
    double confidence = 0.0;
    std::string floor = "terreo";
    EventStatus status = EventStatus::Pending;
    std::optional<double> fee;
    std::optional<int> durationMinutes;
    std::optional<std::string> errorDescription;
};

// 中央服务器对一次事件的答复
struct EventResponse {
    std::string eventId;
    bool success = false;
    GateAction action = GateAction::Error;
    std::optional<double> fee;
    std::optional<int> durationMinutes;
    std::optional<std::string> message;
};

std::string toString(EventKind kind);
std::string toString(EventStatus status);
std::string toString(GateAction action);

// 未知取值抛出 ProtocolError
EventKind eventKindFromString(const std::string& value);
EventStatus eventStatusFromString(const std::string& value);
GateAction gateActionFromString(const std::string& value);

bool isDenial(GateAction action);
