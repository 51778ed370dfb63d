#pragma once
#include "devices.hpp"
#include "event.hpp"
#include "slot_board.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class LaneKind { Entry, Exit };

enum class LaneState {
    Idle,
    VehicleDetected,
    CapturingPlate,
    AwaitingAuthorization,
    Opening,
    WaitingPassage,
    Closing,
    Denied,
    Error
};

std::string toString(LaneKind kind);
std::string toString(LaneState state);

// 车道到中央服务器的链路，失败抛出 ProtocolError
class AuthorityLink {
public:
    virtual ~AuthorityLink() = default;
    virtual EventResponse submit(const Event& event) = 0;
};

// 每次提交新建一个 TCP 连接，一问一答
class TcpAuthorityLink : public AuthorityLink {
public:
    TcpAuthorityLink(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
    EventResponse submit(const Event& event) override;

private:
    LineClient client;
};

struct LaneSettings {
    std::string floor = "terreo";
    double confidenceMin = 0.8;
    std::chrono::milliseconds passageTimeout{10000};
    std::chrono::milliseconds errorBackoff{10000};
    std::chrono::milliseconds pollInterval{1000};
};

/**
 * 单条车道的状态机：
 * Idle → VehicleDetected → CapturingPlate → AwaitingAuthorization
 *      → Opening → WaitingPassage → Closing → Idle
 *      → Denied → Idle
 * 任一步骤失败进入 Error，退避后回到 Idle。
 */
class LaneController {
public:
    LaneController(LaneKind kind, LaneSettings settings, PresenceSensor& presence, PlateCapture& camera,
                   GateDriver& gate, AuthorityLink& authority, SlotBoard& board);
    ~LaneController();

    LaneController(const LaneController&) = delete;
    LaneController& operator=(const LaneController&) = delete;

    void start();
    // 中断当前等待并等待线程退出
    void stop();
    // 执行当前状态对应的一步
    void step();

    LaneState state() const { return current.load(); }
    LaneKind kind() const { return laneKind; }
    std::string name() const;
    std::optional<std::string> lastPlate() const;
    bool running() const { return !stopRequested.load(); }

private:
    LaneKind laneKind;
    LaneSettings settings;
    PresenceSensor& presence;
    PlateCapture& camera;
    GateDriver& gate;
    AuthorityLink& authority;
    SlotBoard& board;

    std::atomic<LaneState> current{LaneState::Idle};
    std::atomic<bool> stopRequested{false};
    std::thread worker;
    mutable std::mutex mutex;
    std::condition_variable wakeup;

    // 本次通行的上下文
    std::optional<std::string> plate;
    double confidence = 0.0;
    std::optional<EventResponse> response;

    void run();
    void transition(LaneState next, const std::string& message = "");
    void fail(const std::string& reason);
    // 可被 stop() 打断的等待，被打断返回 false
    bool sleepFor(std::chrono::milliseconds duration);

    void waitForVehicle();
    void capturePlate();
    void requestAuthorization();
    void runGateCycle();
    bool waitPassage();
    void updateSlots();
    bool isAuthorizing(const EventResponse& reply) const;
};
