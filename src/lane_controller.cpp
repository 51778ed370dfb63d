#include "../include/lane_controller.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/protocol.hpp"
#include "../include/utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

std::string toString(LaneKind kind) {
    return kind == LaneKind::Entry ? "entrada" : "saida";
}

std::string toString(LaneState state) {
    switch (state) {
        case LaneState::Idle: return "idle";
        case LaneState::VehicleDetected: return "vehicle_detected";
        case LaneState::CapturingPlate: return "capturing_plate";
        case LaneState::AwaitingAuthorization: return "awaiting_authorization";
        case LaneState::Opening: return "opening";
        case LaneState::WaitingPassage: return "waiting_passage";
        case LaneState::Closing: return "closing";
        case LaneState::Denied: return "denied";
        case LaneState::Error: return "error";
    }
    return "error";
}

TcpAuthorityLink::TcpAuthorityLink(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
    : client(host, port, timeout) {}

EventResponse TcpAuthorityLink::submit(const Event& event) {
    std::string reply = client.request(protocol::toLine(protocol::encodeEvent(event)));
    return protocol::decodeResponse(protocol::parseLine(reply));
}

namespace {

// 闸门打开后，无论正常结束、异常还是停止，离开作用域时都会关闭
class GateGuard {
public:
    GateGuard(GateDriver& gate, const std::string& lane) : gate(gate), lane(lane) {}
    ~GateGuard() {
        if (!armed) return;
        try {
            gate.close();
        } catch (const std::exception& e) {
            Logger::logLane(lane, "closing", std::string("Failed to close gate: ") + e.what(), Logger::Level::Error);
        }
    }
    GateGuard(const GateGuard&) = delete;
    GateGuard& operator=(const GateGuard&) = delete;

    void arm() { armed = true; }
    void disarm() { armed = false; }

private:
    GateDriver& gate;
    std::string lane;
    bool armed = false;
};

}

LaneController::LaneController(LaneKind kind, LaneSettings settings, PresenceSensor& presence, PlateCapture& camera,
                               GateDriver& gate, AuthorityLink& authority, SlotBoard& board)
    : laneKind(kind), settings(std::move(settings)), presence(presence), camera(camera),
      gate(gate), authority(authority), board(board) {}

LaneController::~LaneController() {
    stop();
}

std::string LaneController::name() const {
    return "lane_" + toString(laneKind);
}

std::optional<std::string> LaneController::lastPlate() const {
    std::lock_guard<std::mutex> lock(mutex);
    return plate;
}

void LaneController::start() {
    if (worker.joinable()) return;
    stopRequested = false;
    worker = std::thread(&LaneController::run, this);
}

void LaneController::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    wakeup.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

void LaneController::run() {
    Logger::logLane(name(), toString(state()), "Lane started");
    while (!stopRequested) {
        step();
    }
    Logger::logLane(name(), toString(state()), "Lane stopped");
}

bool LaneController::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex);
    return !wakeup.wait_for(lock, duration, [this] { return stopRequested.load(); });
}

void LaneController::transition(LaneState next, const std::string& message) {
    current = next;
    Logger::logLane(name(), toString(next), message);
}

void LaneController::fail(const std::string& reason) {
    current = LaneState::Error;
    Logger::logLane(name(), toString(LaneState::Error), reason, Logger::Level::Error);
}

void LaneController::step() {
    try {
        switch (current.load()) {
            case LaneState::Idle:
                waitForVehicle();
                break;
            case LaneState::VehicleDetected:
                transition(LaneState::CapturingPlate, "Capturing plate");
                break;
            case LaneState::CapturingPlate:
                capturePlate();
                break;
            case LaneState::AwaitingAuthorization:
                requestAuthorization();
                break;
            case LaneState::Opening:
            case LaneState::WaitingPassage:
            case LaneState::Closing:
                runGateCycle();
                break;
            case LaneState::Denied:
                {
                    std::string message = response && response->message ? *response->message : "no reason given";
                    Logger::logLane(name(), toString(LaneState::Denied), "Access denied: " + message,
                                    Logger::Level::Warning);
                    response.reset();
                    transition(LaneState::Idle);
                }
                break;
            case LaneState::Error:
                if (sleepFor(settings.errorBackoff)) {
                    response.reset();
                    transition(LaneState::Idle, "Recovered from error");
                }
                break;
        }
    } catch (const std::exception& e) {
        fail(e.what());
    }
}

void LaneController::waitForVehicle() {
    if (presence.detect()) {
        transition(LaneState::VehicleDetected, "Vehicle detected");
        return;
    }
    sleepFor(settings.pollInterval);
}

void LaneController::capturePlate() {
    PlateReading reading = camera.capture();
    if (!reading.plate || reading.plate->empty()) {
        throw ValidationError("Plate capture failed");
    }
    if (reading.confidence < settings.confidenceMin) {
        throw ValidationError("Confidence " + std::to_string(reading.confidence) + " below minimum for " +
                              *reading.plate);
    }
    if (!utils::isValidPlate(*reading.plate)) {
        throw ValidationError("Invalid plate format: " + *reading.plate);
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        plate = reading.plate;
    }
    confidence = reading.confidence;
    transition(LaneState::AwaitingAuthorization, "Plate " + *reading.plate + " captured");
}

void LaneController::requestAuthorization() {
    Event event;
    event.plate = lastPlate().value();
    event.kind = laneKind == LaneKind::Entry ? EventKind::Entry : EventKind::Exit;
    event.timestamp = utils::getCurrentTimeISO();
    event.confidence = confidence;
    event.floor = settings.floor;

    EventResponse reply = authority.submit(event);
    response = reply;

    if (isAuthorizing(reply)) {
        if (reply.action == GateAction::Charge) {
            std::ostringstream msg;
            msg << "Charge for " << event.plate << ": R$ " << std::fixed << std::setprecision(2)
                << reply.fee.value_or(0.0) << " (" << reply.durationMinutes.value_or(0) << " min)";
            Logger::logLane(name(), toString(LaneState::AwaitingAuthorization), msg.str());
        }
        transition(LaneState::Opening, "Authorized, event " + reply.eventId);
    } else if (isDenial(reply.action)) {
        transition(LaneState::Denied, "Denied, event " + reply.eventId);
    } else {
        fail("Unexpected reply from central: " + toString(reply.action) + " - " +
             reply.message.value_or(""));
    }
}

bool LaneController::isAuthorizing(const EventResponse& reply) const {
    GateAction expected = laneKind == LaneKind::Entry ? GateAction::OpenGate : GateAction::Charge;
    return reply.success && reply.action == expected;
}

void LaneController::runGateCycle() {
    GateGuard guard(gate, name());

    transition(LaneState::Opening, "Opening gate");
    guard.arm();
    if (!gate.open()) {
        throw HardwareError("Gate failed to open");
    }

    transition(LaneState::WaitingPassage, "Waiting for passage");
    bool passed = waitPassage();

    transition(LaneState::Closing, passed ? "Vehicle passed, closing gate" : "No passage detected, closing gate");
    guard.disarm();
    if (!gate.close()) {
        throw HardwareError("Gate failed to close");
    }

    if (!passed) {
        fail("Vehicle did not pass before timeout");
        return;
    }

    updateSlots();
    response.reset();
    transition(LaneState::Idle, "Cycle complete");
}

bool LaneController::waitPassage() {
    const auto slice = std::chrono::milliseconds(500);
    auto deadline = std::chrono::steady_clock::now() + settings.passageTimeout;
    while (!stopRequested) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        if (gate.sensePassage(std::min(remaining, slice))) return true;
    }
    return false;
}

void LaneController::updateSlots() {
    std::string vehicle = lastPlate().value_or("");
    if (laneKind == LaneKind::Entry) {
        int slot = board.occupyFirstFree(vehicle);
        if (slot == SlotBoard::kNoSlot) {
            Logger::logLane(name(), toString(LaneState::Closing), "No free slot to mark for " + vehicle,
                            Logger::Level::Warning);
        }
    } else {
        int slot = board.releaseVehicle(vehicle);
        if (slot == SlotBoard::kNoSlot) {
            Logger::logLane(name(), toString(LaneState::Closing), "No occupied slot to release for " + vehicle,
                            Logger::Level::Warning);
        }
    }
}
